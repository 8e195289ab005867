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

#include "traceresult.h"
#include "tools.h"

#include <algorithm>

#include <boost/format.hpp>


// ###### Get name for status ###############################################
#define MakeCase(x) \
   case x: \
      return #x; \
    break;
const char* getStatusName(const HopStatus hopStatus)
{
   switch(hopStatus) {
      MakeCase(Success)
      MakeCase(Timeout)
      MakeCase(Unknown)
      MakeCase(TimeExceeded)
      MakeCase(UnreachableScope)
      MakeCase(UnreachableNetwork)
      MakeCase(UnreachableHost)
      MakeCase(UnreachableProtocol)
      MakeCase(UnreachablePort)
      MakeCase(UnreachableProhibited)
      MakeCase(UnreachableUnknown)
   }
   return "Unknown";
}


// ###### Get name for observation class ####################################
const char* getObservationClassName(const ObservationClass observationClass)
{
   switch(observationClass) {
      case OC_IntermediateHop:
         return "IntermediateHop";
      case OC_DestinationReached:
         return "DestinationReached";
      case OC_Unreachable:
         return "Unreachable";
      case OC_Expired:
         return "Expired";
   }
   return "Unknown";
}


// ###### Get name for trace status #########################################
const char* getTraceStatusName(const TraceStatus traceStatus)
{
   switch(traceStatus) {
      case TS_ReachedDestination:
         return "ReachedDestination";
      case TS_MaxTTLExceeded:
         return "MaxTTLExceeded";
      case TS_DeadlineExceeded:
         return "DeadlineExceeded";
      case TS_Aborted:
         return "Aborted";
   }
   return "Unknown";
}


// ###### Constructor #######################################################
HopObservation::HopObservation(const unsigned int              probeIndex,
                               const ObservationClass          classification,
                               const HopStatus                 status,
                               const boost::asio::ip::address& responderAddress,
                               const TraceDuration&            rtt)
   : ProbeIndex(probeIndex),
     Classification(classification),
     Status(status),
     ResponderAddress(responderAddress),
     RTT(rtt)
{
}


// ###### Create an expired observation #####################################
HopObservation HopObservation::expired(const unsigned int probeIndex)
{
   return HopObservation(probeIndex, OC_Expired, Timeout,
                         boost::asio::ip::address(), TraceDuration(-1));
}


// ###### Output operator ###################################################
std::ostream& operator<<(std::ostream& os, const HopObservation& observation)
{
   if(observation.isExpired()) {
      os << "*";
   }
   else {
      os << observation.ResponderAddress
         << " " << durationToString<TraceDuration>(observation.RTT);
      if(observation.Classification == OC_Unreachable) {
         os << " !" << getStatusName(observation.Status);
      }
   }
   return os;
}


// ###### Constructor #######################################################
HopRecord::HopRecord(const unsigned int ttl)
   : TTL(ttl)
{
}


// ###### Add observation ###################################################
void HopRecord::addObservation(const HopObservation& observation)
{
   assure(!hasObservation(observation.probeIndex()));
   Observations.push_back(observation);
   if(!observation.isExpired()) {
      Addresses.insert(observation.responderAddress());
      RTTSamples.push_back(observation.rtt());
   }
}


// ###### Order observations by probe index #################################
void HopRecord::sortObservations()
{
   std::stable_sort(Observations.begin(), Observations.end(),
                    [](const HopObservation& a, const HopObservation& b) {
                       return a.probeIndex() < b.probeIndex();
                    });
}


// ###### Is there already an observation for the given probe? ##############
bool HopRecord::hasObservation(const unsigned int probeIndex) const
{
   for(const HopObservation& observation : Observations) {
      if(observation.probeIndex() == probeIndex) {
         return true;
      }
   }
   return false;
}


// ###### Has the destination responded at this TTL? ########################
bool HopRecord::destinationReached() const
{
   for(const HopObservation& observation : Observations) {
      if(observation.classification() == OC_DestinationReached) {
         return true;
      }
   }
   return false;
}


// ###### Get number of expired observations ################################
size_t HopRecord::expiredCount() const
{
   return std::count_if(Observations.begin(), Observations.end(),
                        [](const HopObservation& observation) {
                           return observation.isExpired();
                        });
}


// ###### Get minimum RTT ###################################################
TraceDuration HopRecord::minRTT() const
{
   if(RTTSamples.empty()) {
      return TraceDuration(-1);
   }
   return *std::min_element(RTTSamples.begin(), RTTSamples.end());
}


// ###### Get average RTT ###################################################
TraceDuration HopRecord::avgRTT() const
{
   if(RTTSamples.empty()) {
      return TraceDuration(-1);
   }
   TraceDuration sum(0);
   for(const TraceDuration& rtt : RTTSamples) {
      sum += rtt;
   }
   return sum / (TraceDuration::rep)RTTSamples.size();
}


// ###### Get maximum RTT ###################################################
TraceDuration HopRecord::maxRTT() const
{
   if(RTTSamples.empty()) {
      return TraceDuration(-1);
   }
   return *std::max_element(RTTSamples.begin(), RTTSamples.end());
}


// ###### Output operator ###################################################
std::ostream& operator<<(std::ostream& os, const HopRecord& hopRecord)
{
   os << boost::format("%2u") % hopRecord.TTL;
   for(const HopObservation& observation : hopRecord.Observations) {
      os << "  " << observation;
   }
   return os;
}


// ###### Constructor #######################################################
TraceResult::TraceResult(const boost::asio::ip::address& destination,
                         const ProtocolType              protocol,
                         const unsigned int              firstTTL,
                         const SystemTimePoint&          startTime,
                         const TraceDuration&            duration,
                         const TraceStatus               status,
                         std::vector<HopRecord>&&        hops)
   : Destination(destination),
     Protocol(protocol),
     FirstTTL(firstTTL),
     StartTime(startTime),
     Duration(duration),
     Status(status),
     Hops(std::move(hops))
{
   for(size_t i = 0; i < Hops.size(); i++) {
      assure(Hops[i].ttl() == FirstTTL + i);
   }
}


// ###### Get hop record for a TTL ##########################################
const HopRecord* TraceResult::hopForTTL(const unsigned int ttl) const
{
   if( (ttl >= FirstTTL) && (ttl - FirstTTL < Hops.size()) ) {
      return &Hops[ttl - FirstTTL];
   }
   return nullptr;
}


// ###### Get last TTL ######################################################
unsigned int TraceResult::lastTTL() const
{
   return (Hops.empty()) ? 0 : Hops.back().ttl();
}


// ###### Output operator ###################################################
std::ostream& operator<<(std::ostream& os, const TraceResult& traceResult)
{
   os << "Trace to " << traceResult.Destination
      << " via "     << getProtocolName(traceResult.Protocol)
      << ": "        << getTraceStatusName(traceResult.Status)
      << ", "        << traceResult.Hops.size() << " hops"
      << ", "        << durationToString<TraceDuration>(traceResult.Duration);
   for(const HopRecord& hopRecord : traceResult.Hops) {
      os << "\n" << hopRecord;
   }
   return os;
}
