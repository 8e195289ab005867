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

#ifndef PACKETCODEC_H
#define PACKETCODEC_H

#include <stdint.h>

#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>

#include "tools.h"


enum ProtocolType
{
   PT_ICMP = 'i',
   PT_UDP  = 'u',
   PT_TCP  = 't'
};

const char* getProtocolName(const ProtocolType protocol);
bool getProtocolType(const std::string& name, ProtocolType& protocol);


// Result of decoding a single inbound packet. Failures are not exceptional:
// the caller just drops the packet.
enum DecodeStatus
{
   DS_Success   = 0,
   DS_Malformed = 1,   // Truncated or unparseable
   DS_Unrelated = 2    // Valid, but not a response to a probe
};

const char* getDecodeStatusName(const DecodeStatus decodeStatus);


enum ResponseType
{
   RT_EchoReply    = 0,   // ICMP/ICMPv6 Echo Reply
   RT_TimeExceeded = 1,   // ICMP/ICMPv6 Time Exceeded, quoting the probe
   RT_Unreachable  = 2,   // ICMP/ICMPv6 Destination Unreachable, quoting the probe
   RT_TCPResponse  = 3    // TCP RST or SYN+ACK from the probed port
};


// The protocol-specific fields written into a probe
struct ProbeFields
{
   uint16_t Identifier;      // ICMP identifier, UDP/TCP source port
   uint32_t Marker;          // ICMP sequence number, UDP destination port, TCP sequence number
   uint32_t MagicNumber;
   uint16_t Ordinal;
   uint8_t  ProbeIndex;
   uint64_t SendTimeStamp;   // Microseconds since the epoch (informational)
};


// The structured content of an inbound packet
struct ParsedPacket
{
   ParsedPacket() :
      Type(RT_EchoReply),
      ICMPType(0),
      ICMPCode(0),
      TCPControlFlags(0),
      Identifier(0),
      Marker(0),
      HasProbeHeader(false),
      MagicNumber(0),
      ResponseSize(0) { }

   boost::asio::ip::address ResponderAddress;      // Outer source address
   boost::asio::ip::address OriginalDestination;   // Destination of the probe that caused the response
   ResponseType             Type;
   uint8_t                  ICMPType;
   uint8_t                  ICMPCode;
   uint8_t                  TCPControlFlags;
   uint16_t                 Identifier;            // As written by the probe
   uint32_t                 Marker;                // As written by the probe
   bool                     HasProbeHeader;        // Probe header was echoed/quoted
   uint32_t                 MagicNumber;           // Only valid if HasProbeHeader
   TraceTimePoint           ReceiveTime;
   size_t                   ResponseSize;
};


class PacketCodec
{
   public:
   PacketCodec(const ProtocolType                protocol,
               const boost::asio::ip::address&   sourceAddress,
               const boost::asio::ip::address&   destinationAddress,
               const uint16_t                    tcpPort      = 80,
               const uint8_t                     trafficClass = 0);

   inline ProtocolType protocol() const {
      return Protocol;
   }
   inline const boost::asio::ip::address& sourceAddress() const {
      return SourceAddress;
   }
   inline const boost::asio::ip::address& destinationAddress() const {
      return DestinationAddress;
   }

   static size_t transportHeaderSize(const ProtocolType protocol);
   static size_t minimumPayloadSize(const ProtocolType protocol);

   std::vector<uint8_t> encodeProbe(const uint8_t      ttl,
                                    const ProbeFields& fields,
                                    const size_t       payloadSize) const;
   DecodeStatus decodeResponse(const uint8_t*        data,
                               const size_t          length,
                               const TraceTimePoint& receivedAt,
                               ParsedPacket&         parsedPacket) const;

   private:
   DecodeStatus decodeICMP(std::istream& is, const bool isIPv6,
                           ParsedPacket& parsedPacket) const;
   DecodeStatus decodeQuotedProbe(std::istream& is, const bool isIPv6,
                                  ParsedPacket& parsedPacket) const;
   DecodeStatus decodeTCP(std::istream& is,
                          ParsedPacket& parsedPacket) const;

   const ProtocolType             Protocol;
   const boost::asio::ip::address SourceAddress;
   const boost::asio::ip::address DestinationAddress;
   const uint16_t                 TCPPort;
   const uint8_t                  TrafficClass;
};

#endif
