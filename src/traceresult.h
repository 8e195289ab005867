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

#ifndef TRACERESULT_H
#define TRACERESULT_H

#include <set>
#include <ostream>
#include <vector>

#include <boost/asio/ip/address.hpp>

#include "packetcodec.h"
#include "tools.h"


enum HopStatus {
   // ====== Status byte ==================================
   Unknown                   = 0,

   // ====== ICMP responses (from routers) ================
   // NOTE: Status values from 1 to 199 have a given
   //       router address!

   // ------ TTL/Hop Count --------------------------------
   TimeExceeded              = 1,     // ICMP response

   // ------ Reported as "unreachable" --------------------
   // NOTE: Status values from 100 to 199 denote unreachability
   UnreachableScope          = 100,   // ICMP response
   UnreachableNetwork        = 101,   // ICMP response
   UnreachableHost           = 102,   // ICMP response
   UnreachableProtocol       = 103,   // ICMP response
   UnreachablePort           = 104,   // ICMP response
   UnreachableProhibited     = 105,   // ICMP response
   UnreachableUnknown        = 110,   // ICMP response

   // ====== No response  =================================
   Timeout                   = 200,

   // ====== Destination's response (from destination) ====
   Success                   = 255    // Success!
};


// ###### Is destination not reachable? #####################################
inline bool statusIsUnreachable(const HopStatus hopStatus)
{
   // Values 100 to 199 => the destination cannot be reached any more, since
   // a router on the way reported unreachability.
   return( (hopStatus >= UnreachableScope) &&
           (hopStatus < Timeout) );
}

const char* getStatusName(const HopStatus hopStatus);


enum ObservationClass
{
   OC_IntermediateHop    = 0,
   OC_DestinationReached = 1,
   OC_Unreachable        = 2,
   OC_Expired            = 3
};

const char* getObservationClassName(const ObservationClass observationClass);


// ###### One resolved probe ################################################
class HopObservation
{
   public:
   HopObservation(const unsigned int              probeIndex,
                  const ObservationClass          classification,
                  const HopStatus                 status,
                  const boost::asio::ip::address& responderAddress,
                  const TraceDuration&            rtt);

   static HopObservation expired(const unsigned int probeIndex);

   inline unsigned int probeIndex()                          const { return ProbeIndex;                       }
   inline ObservationClass classification()                  const { return Classification;                   }
   inline HopStatus status()                                 const { return Status;                           }
   inline bool isExpired()                                   const { return Classification == OC_Expired;     }
   // Only valid for observations that are not expired:
   inline const boost::asio::ip::address& responderAddress() const { return ResponderAddress;                 }
   // Negative for expired observations:
   inline const TraceDuration& rtt()                         const { return RTT;                              }

   friend std::ostream& operator<<(std::ostream& os, const HopObservation& observation);

   private:
   unsigned int             ProbeIndex;
   ObservationClass         Classification;
   HopStatus                Status;
   boost::asio::ip::address ResponderAddress;
   TraceDuration            RTT;
};


// ###### All observations of one TTL #######################################
class HopRecord
{
   public:
   HopRecord(const unsigned int ttl);

   inline unsigned int ttl() const {
      return TTL;
   }
   inline const std::vector<HopObservation>& observations() const {
      return Observations;
   }
   // Distinct responders, more than one on load-balanced paths:
   inline const std::set<boost::asio::ip::address>& addresses() const {
      return Addresses;
   }
   inline const std::vector<TraceDuration>& rttSamples() const {
      return RTTSamples;
   }

   bool destinationReached() const;
   bool hasObservation(const unsigned int probeIndex) const;
   size_t expiredCount() const;
   TraceDuration minRTT() const;
   TraceDuration avgRTT() const;
   TraceDuration maxRTT() const;

   void addObservation(const HopObservation& observation);
   void sortObservations();

   friend std::ostream& operator<<(std::ostream& os, const HopRecord& hopRecord);

   private:
   unsigned int                       TTL;
   std::vector<HopObservation>        Observations;
   std::set<boost::asio::ip::address> Addresses;
   std::vector<TraceDuration>         RTTSamples;
};


enum TraceStatus
{
   TS_ReachedDestination = 0,
   TS_MaxTTLExceeded     = 1,
   TS_DeadlineExceeded   = 2,
   TS_Aborted            = 3
};

const char* getTraceStatusName(const TraceStatus traceStatus);


// ###### The outcome of a trace ############################################
// Hop records are ordered by ascending TTL, starting at the first TTL,
// without gaps. A trace result is never modified after being handed out.
class TraceResult
{
   public:
   typedef std::vector<HopRecord>::const_iterator const_iterator;

   TraceResult(const boost::asio::ip::address& destination,
               const ProtocolType              protocol,
               const unsigned int              firstTTL,
               const SystemTimePoint&          startTime,
               const TraceDuration&            duration,
               const TraceStatus               status,
               std::vector<HopRecord>&&        hops);

   inline const boost::asio::ip::address& destination() const { return Destination; }
   inline ProtocolType protocol()                        const { return Protocol;    }
   inline unsigned int firstTTL()                        const { return FirstTTL;    }
   inline const SystemTimePoint& startTime()             const { return StartTime;   }
   inline const TraceDuration& duration()                const { return Duration;    }
   inline TraceStatus status()                           const { return Status;      }

   inline size_t size()                                  const { return Hops.size();  }
   inline bool empty()                                   const { return Hops.empty(); }
   inline const_iterator begin()                         const { return Hops.begin(); }
   inline const_iterator end()                           const { return Hops.end();   }
   inline const std::vector<HopRecord>& hops()           const { return Hops;         }
   inline const HopRecord& operator[](const size_t index) const {
      return Hops[index];
   }

   const HopRecord* hopForTTL(const unsigned int ttl) const;
   unsigned int lastTTL() const;

   friend std::ostream& operator<<(std::ostream& os, const TraceResult& traceResult);

   private:
   boost::asio::ip::address Destination;
   ProtocolType             Protocol;
   unsigned int             FirstTTL;
   SystemTimePoint          StartTime;
   TraceDuration            Duration;
   TraceStatus              Status;
   std::vector<HopRecord>   Hops;
};

#endif
