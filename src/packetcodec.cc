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

#include "packetcodec.h"
#include "icmpheader.h"
#include "ipv4header.h"
#include "ipv6header.h"
#include "probeheader.h"
#include "tcpheader.h"
#include "traceexception.h"
#include "udpheader.h"

#include <netinet/in.h>

#include <boost/algorithm/string.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/format.hpp>
#include <boost/interprocess/streams/bufferstream.hpp>


#define MAX_PAYLOAD_SIZE 65000


// ###### Get protocol name #################################################
const char* getProtocolName(const ProtocolType protocol)
{
   switch(protocol) {
      case PT_ICMP:
         return "ICMP";
      case PT_UDP:
         return "UDP";
      case PT_TCP:
         return "TCP";
   }
   return "Unknown";
}


// ###### Get protocol type from name #######################################
bool getProtocolType(const std::string& name, ProtocolType& protocol)
{
   const std::string lowerCaseName = boost::algorithm::to_lower_copy(
                                        boost::algorithm::trim_copy(name));
   if(lowerCaseName == "icmp") {
      protocol = PT_ICMP;
   }
   else if(lowerCaseName == "udp") {
      protocol = PT_UDP;
   }
   else if(lowerCaseName == "tcp") {
      protocol = PT_TCP;
   }
   else {
      return false;
   }
   return true;
}


// ###### Get decode status name ############################################
const char* getDecodeStatusName(const DecodeStatus decodeStatus)
{
   switch(decodeStatus) {
      case DS_Success:
         return "Success";
      case DS_Malformed:
         return "Malformed";
      case DS_Unrelated:
         return "Unrelated";
   }
   return "Unknown";
}


// ###### Constructor #######################################################
PacketCodec::PacketCodec(const ProtocolType              protocol,
                         const boost::asio::ip::address& sourceAddress,
                         const boost::asio::ip::address& destinationAddress,
                         const uint16_t                  tcpPort,
                         const uint8_t                   trafficClass)
   : Protocol(protocol),
     SourceAddress(sourceAddress),
     DestinationAddress(destinationAddress),
     TCPPort(tcpPort),
     TrafficClass(trafficClass)
{
}


// ###### Get size of the transport-layer header ############################
size_t PacketCodec::transportHeaderSize(const ProtocolType protocol)
{
   switch(protocol) {
      case PT_TCP:
         return 20;
      case PT_ICMP:
      case PT_UDP:
         break;
   }
   return 8;
}


// ###### Get minimum payload size ##########################################
size_t PacketCodec::minimumPayloadSize(const ProtocolType protocol)
{
   return transportHeaderSize(protocol) + PROBE_HEADER_SIZE;
}


// ###### Encode a probe ####################################################
std::vector<uint8_t> PacketCodec::encodeProbe(const uint8_t      ttl,
                                              const ProbeFields& fields,
                                              const size_t       payloadSize) const
{
   // ====== Check parameters ===============================================
   if(ttl < 1) {
      throw EncodingError("Invalid TTL 0");
   }
   if(payloadSize < minimumPayloadSize(Protocol)) {
      throw EncodingError(str(boost::format("Payload size %u is below the minimum of %u bytes for %s") %
                                 payloadSize % minimumPayloadSize(Protocol) % getProtocolName(Protocol)));
   }
   if(payloadSize > MAX_PAYLOAD_SIZE) {
      throw EncodingError(str(boost::format("Payload size %u exceeds the maximum of %u bytes") %
                                 payloadSize % MAX_PAYLOAD_SIZE));
   }
   const bool isIPv6 = DestinationAddress.is_v6();
   if( (!SourceAddress.is_unspecified()) && (SourceAddress.is_v6() != isIPv6) ) {
      throw EncodingError(str(boost::format("%s source address %s for %s destination %s") %
                                 addressFamilyName(SourceAddress) % SourceAddress.to_string() %
                                 addressFamilyName(DestinationAddress) % DestinationAddress.to_string()));
   }

   // ====== Prepare probe header and padding ===============================
   ProbeHeader probeHeader;
   probeHeader.magicNumber(fields.MagicNumber);
   probeHeader.sendTTL(ttl);
   probeHeader.probeIndex(fields.ProbeIndex);
   probeHeader.ordinal(fields.Ordinal);
   probeHeader.sendTimeStamp(fields.SendTimeStamp);

   const size_t         headerSize = transportHeaderSize(Protocol);
   std::vector<uint8_t> padding(payloadSize - headerSize - PROBE_HEADER_SIZE);
   for(size_t i = 0; i < padding.size(); i++) {
      padding[i] = static_cast<uint8_t>((headerSize + PROBE_HEADER_SIZE + i) & 0xff);
   }

   // ====== Prepare IP header ==============================================
   uint8_t ipProtocol;
   switch(Protocol) {
      case PT_ICMP:
         ipProtocol = (isIPv6) ? IPPROTO_ICMPV6 : IPPROTO_ICMP;
       break;
      case PT_UDP:
         ipProtocol = IPPROTO_UDP;
       break;
      default:
         ipProtocol = IPPROTO_TCP;
       break;
   }

   IPv6Header ipv6Header;
   IPv4Header ipv4Header;
   if(isIPv6) {
      ipv6Header.trafficClass(TrafficClass);
      ipv6Header.flowLabel(0);
      ipv6Header.payloadLength(payloadSize);
      ipv6Header.nextHeader(ipProtocol);
      ipv6Header.hopLimit(ttl);
      ipv6Header.sourceAddress((SourceAddress.is_v6()) ? SourceAddress.to_v6() :
                                                         boost::asio::ip::address_v6());
      ipv6Header.destinationAddress(DestinationAddress.to_v6());
   }
   else {
      ipv4Header.typeOfService(TrafficClass);
      ipv4Header.totalLength(20 + payloadSize);
      ipv4Header.identification(fields.Ordinal);
      ipv4Header.fragmentOffset(0);
      ipv4Header.timeToLive(ttl);
      ipv4Header.protocol(ipProtocol);
      ipv4Header.sourceAddress((SourceAddress.is_v4()) ? SourceAddress.to_v4() :
                                                         boost::asio::ip::address_v4());
      ipv4Header.destinationAddress(DestinationAddress.to_v4());
      ipv4Header.updateChecksum();
   }

   boost::asio::streambuf packetBuffer;
   std::ostream           os(&packetBuffer);
   if(isIPv6) {
      os << ipv6Header;
   }
   else {
      os << ipv4Header;
   }

   // ====== Prepare transport header =======================================
   uint32_t sum = 0;
   switch(Protocol) {
      case PT_ICMP: {
         ICMPHeader echoRequest;
         echoRequest.type(ICMPHeader::echoRequestType(isIPv6));
         echoRequest.code(0);
         echoRequest.identifier(fields.Identifier);
         echoRequest.seqNumber(static_cast<uint16_t>(fields.Marker));
         echoRequest.checksum(0);
         if(isIPv6) {
            // ICMPv6 includes the pseudo header in the checksum:
            ipv6Header.processPseudoHeader(sum, payloadSize);
         }
         echoRequest.processInternet16(sum);
         probeHeader.processInternet16(sum);
         processInternet16(sum, padding.data(), padding.size());
         echoRequest.checksum(finishInternet16(sum));
         os << echoRequest;
        }
       break;
      case PT_UDP: {
         UDPHeader udpHeader;
         udpHeader.sourcePort(fields.Identifier);
         udpHeader.destinationPort(static_cast<uint16_t>(fields.Marker));
         udpHeader.length(payloadSize);
         udpHeader.checksum(0);
         // Without a source address, the IPv4 pseudo header is unknown.
         // The UDP checksum is optional for IPv4, so it is just omitted.
         if( (isIPv6) || (!SourceAddress.is_unspecified()) ) {
            if(isIPv6) {
               ipv6Header.processPseudoHeader(sum, payloadSize);
            }
            else {
               ipv4Header.processPseudoHeader(sum, payloadSize);
            }
            udpHeader.processInternet16(sum);
            probeHeader.processInternet16(sum);
            processInternet16(sum, padding.data(), padding.size());
            udpHeader.finishChecksum(sum);
         }
         os << udpHeader;
        }
       break;
      case PT_TCP: {
         TCPHeader tcpHeader;
         tcpHeader.sourcePort(fields.Identifier);
         tcpHeader.destinationPort(TCPPort);
         tcpHeader.seqNumber(fields.Marker);
         tcpHeader.ackNumber(0);
         tcpHeader.dataOffset(20);
         tcpHeader.flags(TF_SYN);
         tcpHeader.window(4096);
         tcpHeader.urgentPointer(0);
         tcpHeader.checksum(0);
         if(isIPv6) {
            ipv6Header.processPseudoHeader(sum, payloadSize);
         }
         else {
            ipv4Header.processPseudoHeader(sum, payloadSize);
         }
         tcpHeader.processInternet16(sum);
         probeHeader.processInternet16(sum);
         processInternet16(sum, padding.data(), padding.size());
         tcpHeader.checksum(finishInternet16(sum));
         os << tcpHeader;
        }
       break;
   }

   // ====== Append payload =================================================
   os << probeHeader;
   os.write(reinterpret_cast<const char*>(padding.data()), padding.size());

   const uint8_t* packetData = static_cast<const uint8_t*>(packetBuffer.data().data());
   return std::vector<uint8_t>(packetData, packetData + packetBuffer.size());
}


// ###### Decode a response #################################################
DecodeStatus PacketCodec::decodeResponse(const uint8_t*        data,
                                         const size_t          length,
                                         const TraceTimePoint& receivedAt,
                                         ParsedPacket&         parsedPacket) const
{
   parsedPacket              = ParsedPacket();
   parsedPacket.ReceiveTime  = receivedAt;
   parsedPacket.ResponseSize = length;
   if( (data == nullptr) || (length < 1) ) {
      return DS_Malformed;
   }

   // ====== Check IP version ===============================================
   const uint8_t version = (data[0] >> 4) & 0x0f;
   if( (version != 4) && (version != 6) ) {
      return DS_Malformed;
   }
   const bool isIPv6 = (version == 6);
   if(isIPv6 != DestinationAddress.is_v6()) {
      return DS_Unrelated;
   }

   boost::interprocess::ibufferstream is(reinterpret_cast<const char*>(data), length);

   // ====== IPv6 ===========================================================
   uint8_t ipProtocol;
   if(isIPv6) {
      IPv6Header ipv6Header;
      is >> ipv6Header;
      if(!is) {
         return DS_Malformed;
      }
      parsedPacket.ResponderAddress = ipv6Header.sourceAddress();
      ipProtocol                    = ipv6Header.nextHeader();
   }

   // ====== IPv4 ===========================================================
   else {
      IPv4Header ipv4Header;
      is >> ipv4Header;
      if(!is) {
         return DS_Malformed;
      }
      if(ipv4Header.isFragment()) {
         return DS_Unrelated;
      }
      parsedPacket.ResponderAddress = ipv4Header.sourceAddress();
      ipProtocol                    = ipv4Header.protocol();
   }

   // ====== Transport protocol =============================================
   if( ((isIPv6) && (ipProtocol == IPPROTO_ICMPV6)) ||
       ((!isIPv6) && (ipProtocol == IPPROTO_ICMP)) ) {
      return decodeICMP(is, isIPv6, parsedPacket);
   }
   else if(ipProtocol == IPPROTO_TCP) {
      return decodeTCP(is, parsedPacket);
   }
   return DS_Unrelated;
}


// ###### Decode ICMP/ICMPv6 message ########################################
DecodeStatus PacketCodec::decodeICMP(std::istream& is,
                                     const bool    isIPv6,
                                     ParsedPacket& parsedPacket) const
{
   ICMPHeader icmpHeader;
   is >> icmpHeader;
   if(!is) {
      return DS_Malformed;
   }
   parsedPacket.ICMPType = icmpHeader.type();
   parsedPacket.ICMPCode = icmpHeader.code();

   // ====== Echo Reply =====================================================
   if(icmpHeader.isEchoReply(isIPv6)) {
      if(Protocol != PT_ICMP) {
         return DS_Unrelated;
      }
      parsedPacket.Type                = RT_EchoReply;
      parsedPacket.OriginalDestination = parsedPacket.ResponderAddress;
      parsedPacket.Identifier          = icmpHeader.identifier();
      parsedPacket.Marker              = icmpHeader.seqNumber();

      ProbeHeader probeHeader;
      is >> probeHeader;
      if(is) {
         parsedPacket.HasProbeHeader = true;
         parsedPacket.MagicNumber    = probeHeader.magicNumber();
      }
      return DS_Success;
   }

   // ====== Time Exceeded ==================================================
   else if(icmpHeader.isTimeExceeded(isIPv6)) {
      parsedPacket.Type = RT_TimeExceeded;
      return decodeQuotedProbe(is, isIPv6, parsedPacket);
   }

   // ====== Destination Unreachable ========================================
   else if(icmpHeader.isUnreachable(isIPv6)) {
      parsedPacket.Type = RT_Unreachable;
      return decodeQuotedProbe(is, isIPv6, parsedPacket);
   }

   return DS_Unrelated;
}


// ###### Decode the probe quoted inside an ICMP error ######################
DecodeStatus PacketCodec::decodeQuotedProbe(std::istream& is,
                                            const bool    isIPv6,
                                            ParsedPacket& parsedPacket) const
{
   // ====== Inner IP header ================================================
   uint8_t innerProtocol;
   if(isIPv6) {
      IPv6Header innerIPv6Header;
      is >> innerIPv6Header;
      if(!is) {
         return DS_Malformed;
      }
      parsedPacket.OriginalDestination = innerIPv6Header.destinationAddress();
      innerProtocol                    = innerIPv6Header.nextHeader();
   }
   else {
      IPv4Header innerIPv4Header;
      is >> innerIPv4Header;
      if(!is) {
         return DS_Malformed;
      }
      parsedPacket.OriginalDestination = innerIPv4Header.destinationAddress();
      innerProtocol                    = innerIPv4Header.protocol();
   }

   // ====== Inner transport header =========================================
   switch(Protocol) {
      case PT_ICMP: {
         if(innerProtocol != ((isIPv6) ? IPPROTO_ICMPV6 : IPPROTO_ICMP)) {
            return DS_Unrelated;
         }
         ICMPHeader innerICMPHeader;
         is >> innerICMPHeader;
         if(!is) {
            return DS_Malformed;
         }
         if(!innerICMPHeader.isEchoRequest(isIPv6)) {
            return DS_Unrelated;
         }
         parsedPacket.Identifier = innerICMPHeader.identifier();
         parsedPacket.Marker     = innerICMPHeader.seqNumber();
        }
       break;
      case PT_UDP: {
         if(innerProtocol != IPPROTO_UDP) {
            return DS_Unrelated;
         }
         UDPHeader innerUDPHeader;
         is >> innerUDPHeader;
         if(!is) {
            return DS_Malformed;
         }
         parsedPacket.Identifier = innerUDPHeader.sourcePort();
         parsedPacket.Marker     = innerUDPHeader.destinationPort();
        }
       break;
      case PT_TCP: {
         if(innerProtocol != IPPROTO_TCP) {
            return DS_Unrelated;
         }
         TCPHeader innerTCPHeader;
         innerTCPHeader.readQuoted(is);
         if(!is) {
            return DS_Malformed;
         }
         if(innerTCPHeader.destinationPort() != TCPPort) {
            return DS_Unrelated;
         }
         parsedPacket.Identifier = innerTCPHeader.sourcePort();
         parsedPacket.Marker     = innerTCPHeader.seqNumber();
        }
        // The rest of the TCP header is usually not quoted, so there is
        // no probe header to look at.
        return DS_Success;
   }

   // ====== Probe header, if quoted ========================================
   // RFC 792 only guarantees 8 bytes of the original datagram. Routers
   // following RFC 1812, and ICMPv6 (RFC 4443), quote more.
   ProbeHeader probeHeader;
   is >> probeHeader;
   if(is) {
      parsedPacket.HasProbeHeader = true;
      parsedPacket.MagicNumber    = probeHeader.magicNumber();
   }
   return DS_Success;
}


// ###### Decode TCP segment ################################################
DecodeStatus PacketCodec::decodeTCP(std::istream& is,
                                    ParsedPacket& parsedPacket) const
{
   if(Protocol != PT_TCP) {
      return DS_Unrelated;
   }
   TCPHeader tcpHeader;
   is >> tcpHeader;
   if(!is) {
      return DS_Malformed;
   }
   if(tcpHeader.sourcePort() != TCPPort) {
      return DS_Unrelated;
   }

   // Only RST+ACK or SYN+ACK acknowledge the probe's sequence number:
   if( (!tcpHeader.hasFlags(TF_ACK)) ||
       ( (!tcpHeader.hasFlags(TF_RST)) && (!tcpHeader.hasFlags(TF_SYN)) ) ) {
      return DS_Unrelated;
   }
   parsedPacket.Type                = RT_TCPResponse;
   parsedPacket.TCPControlFlags     = tcpHeader.flags();
   parsedPacket.OriginalDestination = parsedPacket.ResponderAddress;
   parsedPacket.Identifier          = tcpHeader.destinationPort();
   parsedPacket.Marker              = tcpHeader.ackNumber() - 1;   // The SYN occupies one sequence number
   return DS_Success;
}
