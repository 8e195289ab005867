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

#ifndef IPV4HEADER_H
#define IPV4HEADER_H

#include <string.h>

#include <istream>
#include <ostream>
#include <boost/asio/ip/address_v4.hpp>

#include "byteorder.h"
#include "internet16.h"


// ==========================================================================
// From RFC 791:
//
//     0                   1                   2                   3
//     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |Version|  IHL  |Type of Service|          Total Length         |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |         Identification        |Flags|      Fragment Offset    |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |  Time to Live |    Protocol   |         Header Checksum       |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                       Source Address                          |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                    Destination Address                        |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                    Options                    |    Padding    |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// ==========================================================================


class IPv4Header
{
   public:
   IPv4Header() {
      memset(Data, 0, sizeof(Data));
      Data[0] = 0x45;   // Version 4, 20 bytes
   }

   inline uint8_t  version()        const { return Data[0] >> 4;                    }
   inline size_t   headerLength()   const { return (size_t)(Data[0] & 0x0f) << 2;   }
   inline uint8_t  typeOfService()  const { return Data[1];                         }
   inline uint16_t totalLength()    const { return decodeUInt16(&Data[2]);          }
   inline uint16_t identification() const { return decodeUInt16(&Data[4]);          }
   inline bool     dontFragment()   const { return (Data[6] & 0x40) != 0;           }
   inline bool     moreFragments()  const { return (Data[6] & 0x20) != 0;           }
   inline uint16_t fragmentOffset() const { return decodeUInt16(&Data[6]) & 0x1fff; }
   inline uint8_t  timeToLive()     const { return Data[8];                         }
   inline uint8_t  protocol()       const { return Data[9];                         }
   inline uint16_t headerChecksum() const { return decodeUInt16(&Data[10]);         }

   // A fragment other than a complete datagram cannot be decoded:
   inline bool isFragment() const {
      return moreFragments() || (fragmentOffset() != 0);
   }

   inline boost::asio::ip::address_v4 sourceAddress() const {
      return boost::asio::ip::address_v4(decodeUInt32(&Data[12]));
   }
   inline boost::asio::ip::address_v4 destinationAddress() const {
      return boost::asio::ip::address_v4(decodeUInt32(&Data[16]));
   }

   inline void typeOfService(const uint8_t typeOfService)    { Data[1] = typeOfService;                    }
   inline void totalLength(const uint16_t totalLength)       { encodeUInt16(&Data[2], totalLength);        }
   inline void identification(const uint16_t identification) { encodeUInt16(&Data[4], identification);     }
   inline void timeToLive(const uint8_t timeToLive)          { Data[8] = timeToLive;                       }
   inline void protocol(const uint8_t protocol)              { Data[9] = protocol;                         }
   inline void headerChecksum(const uint16_t headerChecksum) { encodeUInt16(&Data[10], headerChecksum);    }
   inline void dontFragment(const bool dontFragment) {
      Data[6] = (dontFragment) ? (Data[6] | 0x40) : (Data[6] & ~0x40);
   }
   inline void moreFragments(const bool moreFragments) {
      Data[6] = (moreFragments) ? (Data[6] | 0x20) : (Data[6] & ~0x20);
   }
   inline void fragmentOffset(const uint16_t fragmentOffset) {
      encodeUInt16(&Data[6], (uint16_t)(Data[6] & 0xe0) << 8 | (fragmentOffset & 0x1fff));
   }
   inline void sourceAddress(const boost::asio::ip::address_v4& sourceAddress) {
      encodeUInt32(&Data[12], sourceAddress.to_uint());
   }
   inline void destinationAddress(const boost::asio::ip::address_v4& destinationAddress) {
      encodeUInt32(&Data[16], destinationAddress.to_uint());
   }

   // Fills in the header checksum; options are not used by probes.
   inline void updateChecksum() {
      headerChecksum(0);
      uint32_t sum = 0;
      processInternet16(sum);
      headerChecksum(finishInternet16(sum));
   }

   inline void processInternet16(uint32_t& sum) const {
      ::processInternet16(sum, Data, headerLength());
   }

   // ====== Pseudo header for UDP and TCP checksums (RFC 768) ===============
   // Source, destination, zero, protocol and the transport-layer length.
   inline void processPseudoHeader(uint32_t& sum, const uint16_t transportLength) const {
      uint8_t pseudoHeader[12];
      memcpy(&pseudoHeader[0], &Data[12], 8);
      pseudoHeader[8] = 0x00;
      pseudoHeader[9] = protocol();
      encodeUInt16(&pseudoHeader[10], transportLength);
      ::processInternet16(sum, pseudoHeader, sizeof(pseudoHeader));
   }

   inline const uint8_t* data() const {
      return Data;
   }
   inline size_t size() const {
      return headerLength();
   }

   // Reads the header including its options. The stream fails on anything
   // that is not a plausible IPv4 header.
   friend std::istream& operator>>(std::istream& is, IPv4Header& header) {
      if(is.read(reinterpret_cast<char*>(header.Data), 20)) {
         if( (header.version() != 4) || (header.headerLength() < 20) ) {
            is.setstate(std::ios::failbit);
         }
         else if(header.headerLength() > 20) {
            is.read(reinterpret_cast<char*>(&header.Data[20]), header.headerLength() - 20);
         }
      }
      return is;
   }

   inline friend std::ostream& operator<<(std::ostream& os, const IPv4Header& header) {
      return os.write(reinterpret_cast<const char*>(header.Data), header.headerLength());
   }

   private:
   uint8_t Data[60];
};

#endif
