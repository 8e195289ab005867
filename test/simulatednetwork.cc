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

#include "simulatednetwork.h"
#include "icmpheader.h"
#include "ipv4header.h"
#include "ipv6header.h"
#include "tcpheader.h"
#include "udpheader.h"

#include <netinet/in.h>

#include <algorithm>

#include <boost/interprocess/streams/bufferstream.hpp>


// ###### Constructor #######################################################
SimulatedNetwork::SimulatedNetwork(const boost::asio::ip::address& localAddress,
                                   const boost::asio::ip::address& destination,
                                   const uint16_t                  tcpPort)
   : LocalAddress(localAddress),
     TCPPort(tcpPort)
{
   Destination.Address    = destination;
   Destination.RTT        = std::chrono::milliseconds(10);
   Destination.Silent     = false;
   Destination.Duplicates = 0;
   QuoteFullPacket        = false;
   Noise                  = false;
   FailAfterPackets       = 0;
}


// ###### Destructor ########################################################
SimulatedNetwork::~SimulatedNetwork()
{
}


// ###### Add router ########################################################
void SimulatedNetwork::addRouter(const boost::asio::ip::address& address,
                                 const std::chrono::milliseconds rtt,
                                 const bool                      silent,
                                 const unsigned int              duplicates)
{
   SimulatedNode router;
   router.Address    = address;
   router.RTT        = rtt;
   router.Silent     = silent;
   router.Duplicates = duplicates;
   Routers.push_back(router);
}


// ###### Configure destination #############################################
void SimulatedNetwork::setDestination(const std::chrono::milliseconds rtt,
                                      const bool                      silent,
                                      const unsigned int              duplicates)
{
   Destination.RTT        = rtt;
   Destination.Silent     = silent;
   Destination.Duplicates = duplicates;
}


// ###### Let sending fail after a number of packets ########################
void SimulatedNetwork::setSendFailure(const unsigned int               afterPackets,
                                      const boost::system::error_code& errorCode)
{
   FailAfterPackets = afterPackets;
   FailureErrorCode = errorCode;
}


// ###### Get number of sent packets ########################################
size_t SimulatedNetwork::sentPackets() const
{
   std::lock_guard<std::mutex> lock(Mutex);
   return SentTTLs.size();
}


// ###### Get TTLs of all sent packets ######################################
std::vector<unsigned int> SimulatedNetwork::sentTTLs() const
{
   std::lock_guard<std::mutex> lock(Mutex);
   return SentTTLs;
}


// ###### Make IP packet ####################################################
std::vector<uint8_t> SimulatedNetwork::makeIPPacket(const boost::asio::ip::address& source,
                                                    const boost::asio::ip::address& destination,
                                                    const uint8_t                   protocol,
                                                    const std::vector<uint8_t>&     payload)
{
   std::vector<uint8_t> packet;
   if(destination.is_v6()) {
      IPv6Header ipv6Header;
      ipv6Header.payloadLength(payload.size());
      ipv6Header.nextHeader(protocol);
      ipv6Header.hopLimit(64);
      ipv6Header.sourceAddress(source.to_v6());
      ipv6Header.destinationAddress(destination.to_v6());
      packet.insert(packet.end(), ipv6Header.data(), ipv6Header.data() + ipv6Header.size());
   }
   else {
      IPv4Header ipv4Header;
      ipv4Header.totalLength(20 + payload.size());
      ipv4Header.timeToLive(64);
      ipv4Header.protocol(protocol);
      ipv4Header.sourceAddress(source.to_v4());
      ipv4Header.destinationAddress(destination.to_v4());
      ipv4Header.updateChecksum();
      packet.insert(packet.end(), ipv4Header.data(), ipv4Header.data() + ipv4Header.size());
   }
   packet.insert(packet.end(), payload.begin(), payload.end());
   return packet;
}


// ###### Make ICMP error quoting a probe ###################################
std::vector<uint8_t> SimulatedNetwork::makeICMPError(const boost::asio::ip::address& source,
                                                     const boost::asio::ip::address& destination,
                                                     const uint8_t                   type,
                                                     const uint8_t                   code,
                                                     const std::vector<uint8_t>&     probe,
                                                     const size_t                    quoteLength)
{
   ICMPHeader icmpHeader;
   icmpHeader.type(type);
   icmpHeader.code(code);

   std::vector<uint8_t> payload(icmpHeader.data(), icmpHeader.data() + icmpHeader.size());
   payload.insert(payload.end(), probe.begin(),
                  probe.begin() + std::min(quoteLength, probe.size()));
   return makeIPPacket(source, destination,
                       (destination.is_v6()) ? IPPROTO_ICMPV6 : IPPROTO_ICMP,
                       payload);
}


// ###### Send a probe ######################################################
void SimulatedNetwork::send(const std::vector<uint8_t>&     packet,
                            const boost::asio::ip::address& destination,
                            boost::system::error_code&      errorCode)
{
   std::lock_guard<std::mutex> lock(Mutex);
   const TraceTimePoint now = TraceClock::now();

   if( (FailureErrorCode) && (SentTTLs.size() >= FailAfterPackets) ) {
      errorCode = FailureErrorCode;
      return;
   }
   errorCode = boost::system::error_code();
   if( (packet.size() < 1) || (destination != Destination.Address) ) {
      return;   // Nobody will answer
   }

   // ====== Get TTL ========================================================
   boost::interprocess::ibufferstream is(reinterpret_cast<const char*>(packet.data()),
                                         packet.size());
   unsigned int ttl;
   if(Destination.Address.is_v6()) {
      IPv6Header ipv6Header;
      is >> ipv6Header;
      ttl = ipv6Header.hopLimit();
   }
   else {
      IPv4Header ipv4Header;
      is >> ipv4Header;
      ttl = ipv4Header.timeToLive();
   }
   if(!is) {
      return;
   }
   SentTTLs.push_back(ttl);

   respond(packet, ttl, now);
   Condition.notify_all();
}


// ###### Let the network respond to a probe ################################
void SimulatedNetwork::respond(const std::vector<uint8_t>& probe,
                               const unsigned int          ttl,
                               const TraceTimePoint&       now)
{
   const bool   isIPv6         = Destination.Address.is_v6();
   const size_t ipHeaderLength = (isIPv6) ? 40 : (probe[0] & 0x0f) * 4;
   const uint8_t protocol      = (isIPv6) ? probe[6] : probe[9];
   if(probe.size() < ipHeaderLength + 8) {
      return;
   }

   // ====== Unrelated traffic ==============================================
   if(Noise) {
      // Truncated garbage:
      const std::vector<uint8_t> garbage = { (uint8_t)((isIPv6) ? 0x60 : 0x45), 0x00, 0x00 };
      Queue.insert(std::make_pair(now, garbage));

      // Response to another session, with another identifier:
      std::vector<uint8_t> otherProbe(probe);
      const size_t identifierOffset = ipHeaderLength + ((protocol == IPPROTO_ICMP) ||
                                                        (protocol == IPPROTO_ICMPV6) ? 4 : 0);
      otherProbe[identifierOffset] ^= 0x5a;
      const boost::asio::ip::address responder =
         (Routers.empty()) ? Destination.Address : Routers.front().Address;
      Queue.insert(std::make_pair(now, makeICMPError(responder, LocalAddress,
                                                     (isIPv6) ? ICMPHeader::IPv6TimeExceeded :
                                                                ICMPHeader::IPv4TimeExceeded,
                                                     0, otherProbe, ipHeaderLength + 8)));

      // Plain UDP datagram:
      const std::vector<uint8_t> datagram(16, 0xee);
      Queue.insert(std::make_pair(now, makeIPPacket(responder, LocalAddress,
                                                    IPPROTO_UDP, datagram)));
   }

   // ====== Router =========================================================
   const size_t quoteLength = ((isIPv6) || (QuoteFullPacket)) ? probe.size() :
                                                                ipHeaderLength + 8;
   if( (ttl >= 1) && (ttl <= Routers.size()) ) {
      const SimulatedNode& router = Routers[ttl - 1];
      if(!router.Silent) {
         deliver(makeICMPError(router.Address, LocalAddress,
                               (isIPv6) ? ICMPHeader::IPv6TimeExceeded : ICMPHeader::IPv4TimeExceeded,
                               0, probe, quoteLength),
                 router, now);
      }
      return;
   }

   // ====== Destination ====================================================
   if(Destination.Silent) {
      return;
   }
   if( (protocol == IPPROTO_ICMP) || (protocol == IPPROTO_ICMPV6) ) {
      // Echo Reply: same identifier, sequence number and payload
      std::vector<uint8_t> reply(probe.begin() + ipHeaderLength, probe.end());
      reply[0] = (isIPv6) ? ICMPHeader::IPv6EchoReply : ICMPHeader::IPv4EchoReply;
      deliver(makeIPPacket(Destination.Address, LocalAddress, protocol, reply),
              Destination, now);
   }
   else if(protocol == IPPROTO_UDP) {
      deliver(makeICMPError(Destination.Address, LocalAddress,
                            (isIPv6) ? ICMPHeader::IPv6Unreachable : ICMPHeader::IPv4Unreachable,
                            (isIPv6) ? 4 : 3,   // Port unreachable
                            probe, quoteLength),
              Destination, now);
   }
   else if(protocol == IPPROTO_TCP) {
      boost::interprocess::ibufferstream is(reinterpret_cast<const char*>(probe.data()) + ipHeaderLength,
                                            probe.size() - ipHeaderLength);
      TCPHeader syn;
      is >> syn;
      if(!is) {
         return;
      }
      const size_t dataLength = probe.size() - ipHeaderLength - syn.dataOffset();
      TCPHeader reset;
      reset.sourcePort(syn.destinationPort());
      reset.destinationPort(syn.sourcePort());
      reset.seqNumber(0);
      reset.ackNumber(syn.seqNumber() + dataLength + 1);
      reset.flags(TF_RST | TF_ACK);
      if(syn.destinationPort() == TCPPort) {
         const std::vector<uint8_t> segment(reset.data(), reset.data() + reset.size());
         deliver(makeIPPacket(Destination.Address, LocalAddress, IPPROTO_TCP, segment),
                 Destination, now);
      }
   }
}


// ###### Queue response for delivery after the node's RTT ##################
void SimulatedNetwork::deliver(const std::vector<uint8_t>& response,
                               const SimulatedNode&        node,
                               const TraceTimePoint&       now)
{
   for(unsigned int i = 0; i <= node.Duplicates; i++) {
      Queue.insert(std::make_pair(now + node.RTT + std::chrono::milliseconds(i), response));
   }
}


// ###### Receive next packet ###############################################
bool SimulatedNetwork::receive(const TraceTimePoint& deadline,
                               ReceivedPacket&       receivedPacket)
{
   std::unique_lock<std::mutex> lock(Mutex);
   while(true) {
      const TraceTimePoint now = TraceClock::now();
      if( (!Queue.empty()) && (Queue.begin()->first <= now) ) {
         receivedPacket.Data        = Queue.begin()->second;
         receivedPacket.ReceiveTime = Queue.begin()->first;
         Queue.erase(Queue.begin());
         return true;
      }
      if(now >= deadline) {
         return false;
      }
      TraceTimePoint wakeUp = deadline;
      if( (!Queue.empty()) && (Queue.begin()->first < wakeUp) ) {
         wakeUp = Queue.begin()->first;
      }
      Condition.wait_until(lock, wakeUp);
   }
}
