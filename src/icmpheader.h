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

#ifndef ICMPHEADER_H
#define ICMPHEADER_H

#include <string.h>

#include <istream>
#include <ostream>

#include "byteorder.h"
#include "internet16.h"


// ==========================================================================
// From RFC 792 and RFC 4443:
//
//        0                   1                   2                   3
//        0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       |     Type      |     Code      |          Checksum             |
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       |           Identifier          |        Sequence Number        |
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       |     Data ...
//       +-+-+-+-+-
//
// For error messages (Time Exceeded, Destination Unreachable), the second
// word is unused and followed by the beginning of the original packet.
// ==========================================================================

class ICMPHeader
{
   public:
   enum ICMPType {
      IPv4EchoReply    = 0,
      IPv4Unreachable  = 3,
      IPv4EchoRequest  = 8,
      IPv4TimeExceeded = 11,

      IPv6Unreachable  = 1,
      IPv6TimeExceeded = 3,
      IPv6EchoRequest  = 128,
      IPv6EchoReply    = 129
   };

   ICMPHeader() {
      memset(Data, 0, sizeof(Data));
   }

   inline uint8_t  type()       const { return Data[0];                }
   inline uint8_t  code()       const { return Data[1];                }
   inline uint16_t checksum()   const { return decodeUInt16(&Data[2]); }
   inline uint16_t identifier() const { return decodeUInt16(&Data[4]); }
   inline uint16_t seqNumber()  const { return decodeUInt16(&Data[6]); }

   inline void type(const uint8_t type)          { Data[0] = type;                   }
   inline void code(const uint8_t code)          { Data[1] = code;                   }
   inline void checksum(const uint16_t checksum) { encodeUInt16(&Data[2], checksum); }
   inline void identifier(const uint16_t id)     { encodeUInt16(&Data[4], id);       }
   inline void seqNumber(const uint16_t seqNum)  { encodeUInt16(&Data[6], seqNum);   }

   // ====== Type numbers depend on the ICMP version ========================
   inline static uint8_t echoRequestType(const bool isIPv6) {
      return (isIPv6) ? IPv6EchoRequest : IPv4EchoRequest;
   }
   inline static uint8_t echoReplyType(const bool isIPv6) {
      return (isIPv6) ? IPv6EchoReply : IPv4EchoReply;
   }
   inline bool isEchoRequest(const bool isIPv6) const {
      return type() == echoRequestType(isIPv6);
   }
   inline bool isEchoReply(const bool isIPv6) const {
      return type() == echoReplyType(isIPv6);
   }
   inline bool isTimeExceeded(const bool isIPv6) const {
      return type() == ((isIPv6) ? IPv6TimeExceeded : IPv4TimeExceeded);
   }
   inline bool isUnreachable(const bool isIPv6) const {
      return type() == ((isIPv6) ? IPv6Unreachable : IPv4Unreachable);
   }

   inline void processInternet16(uint32_t& sum) const {
      ::processInternet16(sum, Data, sizeof(Data));
   }

   inline const uint8_t* data() const {
      return Data;
   }
   inline size_t size() const {
      return sizeof(Data);
   }

   inline friend std::istream& operator>>(std::istream& is, ICMPHeader& header) {
      return is.read(reinterpret_cast<char*>(header.Data), sizeof(header.Data));
   }

   inline friend std::ostream& operator<<(std::ostream& os, const ICMPHeader& header) {
      return os.write(reinterpret_cast<const char*>(header.Data), sizeof(header.Data));
   }

   private:
   uint8_t Data[8];
};

#endif
