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

#ifndef UDPHEADER_H
#define UDPHEADER_H

#include <string.h>

#include <istream>
#include <ostream>

#include "byteorder.h"
#include "internet16.h"


// ==========================================================================
// From RFC 768:
//
//    0      7 8     15 16    23 24    31
//    +--------+--------+--------+--------+
//    |     Source      |   Destination   |
//    |      Port       |      Port       |
//    +--------+--------+--------+--------+
//    |                 |                 |
//    |     Length      |    Checksum     |
//    +--------+--------+--------+--------+
//    |
//    |          data octets ...
//    +---------------- ...
//
// ==========================================================================

class UDPHeader
{
   public:
   UDPHeader() {
      memset(Data, 0, sizeof(Data));
   }

   inline uint16_t sourcePort()      const { return decodeUInt16(&Data[0]); }
   inline uint16_t destinationPort() const { return decodeUInt16(&Data[2]); }
   inline uint16_t length()          const { return decodeUInt16(&Data[4]); }
   inline uint16_t checksum()        const { return decodeUInt16(&Data[6]); }

   inline void sourcePort(const uint16_t sourcePort)           { encodeUInt16(&Data[0], sourcePort);      }
   inline void destinationPort(const uint16_t destinationPort) { encodeUInt16(&Data[2], destinationPort); }
   inline void length(const uint16_t length)                   { encodeUInt16(&Data[4], length);          }

   // A computed checksum of 0 is transmitted as 0xffff, since 0 means
   // "no checksum" (RFC 768).
   inline void checksum(const uint16_t checksum)               { encodeUInt16(&Data[6], checksum);        }
   inline void finishChecksum(const uint32_t sum) {
      const uint16_t value = finishInternet16(sum);
      checksum((value != 0) ? value : 0xffff);
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

   // NOTE: The length field is not checked here. A header quoted inside an
   //       ICMP error carries the length of the original datagram, which
   //       is usually longer than the quoted part.
   inline friend std::istream& operator>>(std::istream& is, UDPHeader& header) {
      return is.read(reinterpret_cast<char*>(header.Data), sizeof(header.Data));
   }

   inline friend std::ostream& operator<<(std::ostream& os, const UDPHeader& header) {
      return os.write(reinterpret_cast<const char*>(header.Data), sizeof(header.Data));
   }

   private:
   uint8_t Data[8];
};

#endif
