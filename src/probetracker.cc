// ==========================================================================
//                ---  RTrace - Route Tracing Engine  ---
// ==========================================================================
//
// RTrace - Route Tracing Engine
// Copyright (C) 2025 by the RTrace developers
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "probetracker.h"
#include "tools.h"
#include "logger.h"

#include <netinet/icmp6.h>
#include <netinet/ip_icmp.h>


// ###### Constructor #######################################################
ProbeTracker::ProbeTracker(const TraceConfiguration& configuration,
                           const IdentityScheme&     identityScheme)
   : Scheme(identityScheme),
     Destination(configuration.getDestination()),
     FirstTTL(configuration.getFirstTTL()),
     MaxTTL(configuration.getMaxTTL()),
     ProbesPerHop(configuration.getProbesPerHop()),
     MaxInFlight(configuration.getMaxInFlight()),
     ProbeTimeout(std::chrono::duration_cast<TraceDuration>(configuration.getProbeTimeout()))
{
   Dispatching     = true;
   NextTTL         = FirstTTL;
   NextProbeIndex  = 0;
   LastHop         = MaxTTL + 1;
   NextFinalizeTTL = FirstTTL;
}


// ###### Destructor ########################################################
ProbeTracker::~ProbeTracker()
{
}


// ###### Get the next probe to send, if one may be sent now ################
bool ProbeTracker::nextProbe(unsigned int& ttl, unsigned int& probeIndex) const
{
   if( (dispatchFinished()) || (Pending.size() >= MaxInFlight) ) {
      return false;
   }
   ttl        = NextTTL;
   probeIndex = NextProbeIndex;
   return true;
}


// ###### Have all probes been sent? ########################################
bool ProbeTracker::dispatchFinished() const
{
   return( (!Dispatching) || (NextTTL > ttlLimit()) );
}


// ###### Stop sending further probes #######################################
void ProbeTracker::stopDispatching()
{
   if(Dispatching) {
      RTRACE_LOG(debug) << "Stopping dispatch at TTL " << NextTTL
                        << ", probe " << NextProbeIndex;
      Dispatching = false;
   }
}


// ###### A probe has been sent #############################################
void ProbeTracker::probeSent(const unsigned int    ttl,
                             const unsigned int    probeIndex,
                             const TraceTimePoint& sendTime)
{
   assure(!dispatchFinished());
   assure( (ttl == NextTTL) && (probeIndex == NextProbeIndex) );

   // ====== Create hop record on first probe of a TTL ======================
   if(ttl - FirstTTL == Records.size()) {
      Records.push_back(HopRecord(ttl));
   }
   assure(ttl - FirstTTL < Records.size());

   // ====== Record pending probe ===========================================
   PendingProbe pendingProbe;
   pendingProbe.Identity   = Scheme.makeIdentity(ttl, probeIndex);
   pendingProbe.TTL        = ttl;
   pendingProbe.ProbeIndex = probeIndex;
   pendingProbe.SendTime   = sendTime;
   pendingProbe.ExpiryTime = sendTime + ProbeTimeout;
   const bool inserted = Pending.insert(std::make_pair(pendingProbe.Identity.Ordinal,
                                                       pendingProbe)).second;
   assure(inserted);
   RTRACE_LOG(trace) << "Sent probe " << pendingProbe.Identity
                     << " (TTL " << ttl << ", probe " << probeIndex << ")";

   // ====== Advance dispatch cursor ========================================
   NextProbeIndex++;
   if(NextProbeIndex >= ProbesPerHop) {
      NextProbeIndex = 0;
      NextTTL++;
   }
}


// ###### Classify a response ###############################################
// Returns OC_Expired for responses that cannot be a reaction to the probe.
void ProbeTracker::classify(const ParsedPacket& parsedPacket,
                            ObservationClass&   classification,
                            HopStatus&          status) const
{
   const bool fromDestination = (dropScopeID(parsedPacket.ResponderAddress) == Destination);

   classification = OC_Expired;
   status         = Unknown;
   switch(parsedPacket.Type) {

      // ====== Responses from the destination ==============================
      case RT_EchoReply:
      case RT_TCPResponse:
         if(fromDestination) {
            classification = OC_DestinationReached;
            status         = Success;
         }
       break;

      // ====== Time Exceeded ================================================
      case RT_TimeExceeded:
         classification = OC_IntermediateHop;
         status         = TimeExceeded;
       break;

      // ====== Destination Unreachable ======================================
      case RT_Unreachable:
         if(Destination.is_v6()) {
            switch(parsedPacket.ICMPCode) {
               case ICMP6_DST_UNREACH_ADMIN:
                  status = UnreachableProhibited;
               break;
               case ICMP6_DST_UNREACH_BEYONDSCOPE:
                  status = UnreachableScope;
               break;
               case ICMP6_DST_UNREACH_NOROUTE:
                  status = UnreachableNetwork;
               break;
               case ICMP6_DST_UNREACH_ADDR:
                  status = UnreachableHost;
               break;
               case ICMP6_DST_UNREACH_NOPORT:
                  status = UnreachablePort;
               break;
               default:
                  status = UnreachableUnknown;
               break;
            }
         }
         else {
            switch(parsedPacket.ICMPCode) {
               case ICMP_UNREACH_FILTER_PROHIB:
                  status = UnreachableProhibited;
               break;
               case ICMP_UNREACH_NET:
               case ICMP_UNREACH_NET_UNKNOWN:
                  status = UnreachableNetwork;
               break;
               case ICMP_UNREACH_HOST:
               case ICMP_UNREACH_HOST_UNKNOWN:
                  status = UnreachableHost;
               break;
               case ICMP_UNREACH_PROTOCOL:
                  status = UnreachableProtocol;
               break;
               case ICMP_UNREACH_PORT:
                  status = UnreachablePort;
               break;
               default:
                  status = UnreachableUnknown;
               break;
            }
         }
         // A closed port at the destination is the regular end of a UDP trace:
         if( (fromDestination) && (status == UnreachablePort) ) {
            classification = OC_DestinationReached;
            status         = Success;
         }
         else {
            classification = OC_Unreachable;
         }
       break;
   }
}


// ###### Handle a decoded response #########################################
MatchResult ProbeTracker::handleResponse(const ParsedPacket& parsedPacket)
{
   // ====== Find the probe =================================================
   ProbeIdentity identity;
   if(!Scheme.extractIdentity(parsedPacket, identity)) {
      RTRACE_LOG(trace) << "Discarding response from " << parsedPacket.ResponderAddress
                        << " without identity of this trace";
      return MR_Unrelated;
   }
   if(dropScopeID(parsedPacket.OriginalDestination) != Destination) {
      RTRACE_LOG(warning) << "Mapping mismatch: probe " << identity
                          << " for " << Destination
                          << ", response from " << parsedPacket.ResponderAddress
                          << " for " << parsedPacket.OriginalDestination
                          << " T=" << (unsigned int)parsedPacket.ICMPType
                          << " C=" << (unsigned int)parsedPacket.ICMPCode;
      return MR_Unrelated;
   }
   std::map<uint16_t, PendingProbe>::iterator found = Pending.find(identity.Ordinal);
   if(found == Pending.end()) {
      RTRACE_LOG(trace) << "Discarding response from " << parsedPacket.ResponderAddress
                        << " for probe " << identity << ", which is not pending";
      return MR_NotPending;
   }
   // A response arriving after the probe's timeout does not resolve it.
   // The probe is left for expireProbes().
   if(parsedPacket.ReceiveTime >= found->second.ExpiryTime) {
      RTRACE_LOG(trace) << "Discarding late response from " << parsedPacket.ResponderAddress
                        << " for probe " << identity;
      return MR_NotPending;
   }

   // ====== Classify =======================================================
   ObservationClass classification;
   HopStatus        status;
   classify(parsedPacket, classification, status);
   if(classification == OC_Expired) {
      RTRACE_LOG(trace) << "Discarding unexpected response from " << parsedPacket.ResponderAddress
                        << " for probe " << identity;
      return MR_Unrelated;
   }

   // ====== Resolve the probe ==============================================
   const PendingProbe pendingProbe = found->second;
   Pending.erase(found);

   TraceDuration rtt = parsedPacket.ReceiveTime - pendingProbe.SendTime;
   if(rtt < TraceDuration::zero()) {
      rtt = TraceDuration::zero();
   }
   const HopObservation observation(pendingProbe.ProbeIndex, classification, status,
                                    dropScopeID(parsedPacket.ResponderAddress), rtt);
   assure(pendingProbe.TTL - FirstTTL < Records.size());
   Records[pendingProbe.TTL - FirstTTL].addObservation(observation);
   RTRACE_LOG(trace) << "Probe " << identity << " (TTL " << pendingProbe.TTL
                     << ", probe " << pendingProbe.ProbeIndex << "): "
                     << getObservationClassName(classification) << " " << observation;

   if(classification == OC_DestinationReached) {
      lowerLastHop(pendingProbe.TTL);
   }
   finalizeReadyHops();
   return MR_Matched;
}


// ###### The destination has been seen at the given TTL ####################
void ProbeTracker::lowerLastHop(const unsigned int ttl)
{
   if(ttl >= LastHop) {
      return;
   }
   RTRACE_LOG(debug) << "Destination " << Destination << " reached at TTL " << ttl;
   LastHop = ttl;

   // ====== Discard everything beyond the destination ======================
   std::map<uint16_t, PendingProbe>::iterator iterator = Pending.begin();
   while(iterator != Pending.end()) {
      if(iterator->second.TTL > LastHop) {
         iterator = Pending.erase(iterator);
      }
      else {
         iterator++;
      }
   }
   if(Records.size() > LastHop - FirstTTL + 1) {
      Records.erase(Records.begin() + (LastHop - FirstTTL + 1), Records.end());
   }
}


// ###### Expire probes #####################################################
size_t ProbeTracker::expireProbes(const TraceTimePoint& now)
{
   size_t                                     expired  = 0;
   std::map<uint16_t, PendingProbe>::iterator iterator = Pending.begin();
   while(iterator != Pending.end()) {
      const PendingProbe& pendingProbe = iterator->second;
      if(pendingProbe.ExpiryTime <= now) {
         RTRACE_LOG(debug) << "Probe " << pendingProbe.Identity << " (TTL " << pendingProbe.TTL
                           << ", probe " << pendingProbe.ProbeIndex << ") expired";
         Records[pendingProbe.TTL - FirstTTL].addObservation(
            HopObservation::expired(pendingProbe.ProbeIndex));
         iterator = Pending.erase(iterator);
         expired++;
      }
      else {
         iterator++;
      }
   }
   if(expired > 0) {
      finalizeReadyHops();
   }
   return expired;
}


// ###### Get the earliest expiry time of all pending probes ################
bool ProbeTracker::nextExpiry(TraceTimePoint& expiryTime) const
{
   if(Pending.empty()) {
      return false;
   }
   expiryTime = TraceTimePoint::max();
   for(const std::pair<const uint16_t, PendingProbe>& pending : Pending) {
      expiryTime = std::min(expiryTime, pending.second.ExpiryTime);
   }
   return true;
}


// ###### Finalise hop records in TTL order #################################
void ProbeTracker::finalizeReadyHops()
{
   while( (NextFinalizeTTL <= ttlLimit()) &&
          (NextFinalizeTTL - FirstTTL < Records.size()) ) {
      HopRecord& hopRecord = Records[NextFinalizeTTL - FirstTTL];
      if(hopRecord.observations().size() < ProbesPerHop) {
         break;
      }
      hopRecord.sortObservations();
      RTRACE_LOG(debug) << "Finalised hop " << hopRecord;
      NextFinalizeTTL++;
   }
}


// ###### Is the trace complete? ############################################
bool ProbeTracker::complete() const
{
   return(NextFinalizeTTL > ttlLimit());
}


// ###### Finish the trace and hand out the result ##########################
TraceResult ProbeTracker::finish(const TraceStatus      status,
                                 const SystemTimePoint& startTime,
                                 const TraceDuration&   duration)
{
   stopDispatching();

   // ====== Expire everything still pending ================================
   for(const std::pair<const uint16_t, PendingProbe>& pending : Pending) {
      const PendingProbe& pendingProbe = pending.second;
      assure(pendingProbe.TTL - FirstTTL < Records.size());
      Records[pendingProbe.TTL - FirstTTL].addObservation(
         HopObservation::expired(pendingProbe.ProbeIndex));
   }
   Pending.clear();

   // ====== Finalise all dispatched TTLs ===================================
   for(HopRecord& hopRecord : Records) {
      hopRecord.sortObservations();
   }
   NextFinalizeTTL = FirstTTL + Records.size();

   TraceResult traceResult(Destination, Scheme.protocol(), FirstTTL,
                           startTime, duration, status, std::move(Records));
   Records.clear();
   return traceResult;
}
