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

#ifndef PROBETRACKER_H
#define PROBETRACKER_H

#include <algorithm>
#include <map>
#include <vector>

#include <boost/asio/ip/address.hpp>

#include "packetcodec.h"
#include "probeidentity.h"
#include "traceconfiguration.h"
#include "traceresult.h"
#include "tools.h"


enum MatchResult
{
   MR_Matched    = 0,   // Resolved a pending probe
   MR_Unrelated  = 1,   // Not a response to this trace
   MR_NotPending = 2    // Response to a probe that is already resolved, expired or discarded
};


struct PendingProbe
{
   ProbeIdentity  Identity;
   unsigned int   TTL;
   unsigned int   ProbeIndex;
   TraceTimePoint SendTime;
   TraceTimePoint ExpiryTime;
};


// ###### Probe tracker #####################################################
// The state machine of a trace, without any I/O: it decides which probe to
// send next, matches responses to pending probes, expires probes and
// finalises the hop records in TTL order. All times are passed in, so that
// it can be driven by recorded or synthetic packet sequences.
class ProbeTracker
{
   public:
   ProbeTracker(const TraceConfiguration& configuration,
                const IdentityScheme&     identityScheme);
   ~ProbeTracker();

   // ====== Dispatch =======================================================
   bool nextProbe(unsigned int& ttl, unsigned int& probeIndex) const;
   bool dispatchFinished() const;
   void probeSent(const unsigned int    ttl,
                  const unsigned int    probeIndex,
                  const TraceTimePoint& sendTime);
   void stopDispatching();

   // ====== Reception ======================================================
   MatchResult handleResponse(const ParsedPacket& parsedPacket);
   size_t expireProbes(const TraceTimePoint& now);
   bool nextExpiry(TraceTimePoint& expiryTime) const;

   // ====== State ==========================================================
   inline size_t pendingCount() const {
      return Pending.size();
   }
   inline size_t finalizedCount() const {
      return NextFinalizeTTL - FirstTTL;
   }
   inline bool destinationReached() const {
      return LastHop <= MaxTTL;
   }
   inline unsigned int lastHop() const {
      return LastHop;
   }
   bool complete() const;

   TraceResult finish(const TraceStatus     status,
                      const SystemTimePoint& startTime,
                      const TraceDuration&   duration);

   private:
   inline unsigned int ttlLimit() const {
      return std::min(MaxTTL, LastHop);
   }
   void classify(const ParsedPacket& parsedPacket,
                 ObservationClass&   classification,
                 HopStatus&          status) const;
   void lowerLastHop(const unsigned int ttl);
   void finalizeReadyHops();

   const IdentityScheme&                Scheme;
   const boost::asio::ip::address       Destination;
   const unsigned int                   FirstTTL;
   const unsigned int                   MaxTTL;
   const unsigned int                   ProbesPerHop;
   const unsigned int                   MaxInFlight;
   const TraceDuration                  ProbeTimeout;

   bool                                 Dispatching;
   unsigned int                         NextTTL;            // Dispatch cursor
   unsigned int                         NextProbeIndex;
   unsigned int                         LastHop;            // TTL of the destination, MaxTTL + 1 if unknown
   unsigned int                         NextFinalizeTTL;
   std::map<uint16_t, PendingProbe>     Pending;            // Ordinal -> pending probe
   std::vector<HopRecord>               Records;            // FirstTTL, FirstTTL + 1, ...
};

#endif
