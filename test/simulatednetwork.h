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

#ifndef SIMULATEDNETWORK_H
#define SIMULATEDNETWORK_H

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <vector>

#include <boost/asio/ip/address.hpp>

#include "packetcodec.h"
#include "transport.h"


struct SimulatedNode
{
   boost::asio::ip::address  Address;
   std::chrono::milliseconds RTT;
   bool                      Silent;
   unsigned int              Duplicates;   // Additional copies of each response
};


// ###### Simulated network #################################################
// A transport channel for tests: every probe is decoded, and the node at the
// probe's TTL answers as a real router or host would, after its RTT.
class SimulatedNetwork : public TransportChannel
{
   public:
   SimulatedNetwork(const boost::asio::ip::address& localAddress,
                    const boost::asio::ip::address& destination,
                    const uint16_t                  tcpPort = 80);
   virtual ~SimulatedNetwork();

   void addRouter(const boost::asio::ip::address& address,
                  const std::chrono::milliseconds rtt,
                  const bool                      silent     = false,
                  const unsigned int              duplicates = 0);
   void setDestination(const std::chrono::milliseconds rtt,
                       const bool                      silent     = false,
                       const unsigned int              duplicates = 0);
   inline void setQuoteFullPacket(const bool quoteFullPacket) {
      QuoteFullPacket = quoteFullPacket;
   }
   inline void setNoise(const bool noise) {
      Noise = noise;
   }
   void setSendFailure(const unsigned int                afterPackets,
                       const boost::system::error_code&  errorCode);

   size_t sentPackets() const;
   std::vector<unsigned int> sentTTLs() const;

   virtual void send(const std::vector<uint8_t>&     packet,
                     const boost::asio::ip::address& destination,
                     boost::system::error_code&      errorCode);
   virtual bool receive(const TraceTimePoint& deadline,
                        ReceivedPacket&       receivedPacket);

   static std::vector<uint8_t> makeIPPacket(const boost::asio::ip::address& source,
                                            const boost::asio::ip::address& destination,
                                            const uint8_t                   protocol,
                                            const std::vector<uint8_t>&     payload);
   static std::vector<uint8_t> makeICMPError(const boost::asio::ip::address& source,
                                             const boost::asio::ip::address& destination,
                                             const uint8_t                   type,
                                             const uint8_t                   code,
                                             const std::vector<uint8_t>&     probe,
                                             const size_t                    quoteLength);

   private:
   void respond(const std::vector<uint8_t>& probe,
                const unsigned int          ttl,
                const TraceTimePoint&       now);
   void deliver(const std::vector<uint8_t>& response,
                const SimulatedNode&        node,
                const TraceTimePoint&       now);

   const boost::asio::ip::address                  LocalAddress;
   const uint16_t                                  TCPPort;
   std::vector<SimulatedNode>                      Routers;
   SimulatedNode                                   Destination;
   bool                                            QuoteFullPacket;
   bool                                            Noise;
   unsigned int                                    FailAfterPackets;
   boost::system::error_code                       FailureErrorCode;

   mutable std::mutex                              Mutex;
   std::condition_variable                         Condition;
   std::multimap<TraceTimePoint, std::vector<uint8_t>> Queue;
   std::vector<unsigned int>                       SentTTLs;
};

#endif
