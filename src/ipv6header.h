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

#ifndef IPV6HEADER_H
#define IPV6HEADER_H

#include <string.h>

#include <istream>
#include <ostream>
#include <boost/asio/ip/address_v6.hpp>

#include "byteorder.h"
#include "internet16.h"


// ==========================================================================
// From RFC 8200:
//
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |Version| Traffic Class |           Flow Label                  |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |         Payload Length        |  Next Header  |   Hop Limit   |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                                                               |
//    +                                                               +
//    |                                                               |
//    +                         Source Address                        +
//    |                                                               |
//    +                                                               +
//    |                                                               |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                                                               |
//    +                                                               +
//    |                                                               |
//    +                      Destination Address                      +
//    |                                                               |
//    +                                                               +
//    |                                                               |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// ==========================================================================

class IPv6Header
{
   public:
   IPv6Header() {
      memset(Data, 0, sizeof(Data));
      version(6);
   }

   inline uint8_t  version()       const { return (Data[0] >> 4) & 0x0f;                             }
   inline uint8_t  trafficClass()  const { return ((Data[0] & 0x0f) << 4) | ((Data[1] >> 4) & 0x0f); }
   inline uint32_t flowLabel()     const { return decodeUInt32(&Data[0]) & 0x000fffff;               }
   inline uint16_t payloadLength() const { return decodeUInt16(&Data[4]);                            }
   inline uint8_t  nextHeader()    const { return Data[6];                                           }
   inline uint8_t  hopLimit()      const { return Data[7];                                           }

   inline boost::asio::ip::address_v6 sourceAddress() const {
      boost::asio::ip::address_v6::bytes_type v6address;
      memcpy(v6address.data(), &Data[8], 16);
      return boost::asio::ip::address_v6(v6address, 0);
   }

   inline boost::asio::ip::address_v6 destinationAddress() const {
      boost::asio::ip::address_v6::bytes_type v6address;
      memcpy(v6address.data(), &Data[24], 16);
      return boost::asio::ip::address_v6(v6address, 0);
   }

   inline void version(const uint8_t version)              { Data[0] = ((version & 0x0f) << 4) | (Data[0] & 0x0f); }
   inline void trafficClass(const uint8_t trafficClass)    {
      Data[0] = (Data[0] & 0xf0) | ((trafficClass & 0xf0) >> 4);
      Data[1] = (Data[1] & 0x0f) | ((trafficClass & 0x0f) << 4);
   }
   inline void flowLabel(const uint32_t flowLabel) {
      encodeUInt32(&Data[0], (decodeUInt32(&Data[0]) & 0xfff00000) | (flowLabel & 0x000fffff));
   }
   inline void payloadLength(const uint16_t payloadLength) { encodeUInt16(&Data[4], payloadLength); }
   inline void nextHeader(const uint8_t nextHeader)        { Data[6] = nextHeader;                  }
   inline void hopLimit(const uint8_t hopLimit)            { Data[7] = hopLimit;                    }

   inline void sourceAddress(const boost::asio::ip::address_v6& sourceAddress) {
      memcpy(&Data[8], sourceAddress.to_bytes().data(), 16);
   }
   inline void destinationAddress(const boost::asio::ip::address_v6& destinationAddress) {
      memcpy(&Data[24], destinationAddress.to_bytes().data(), 16);
   }

   // ====== Pseudo header for upper-layer checksums (RFC 8200, 8.1) ========
   // Source, destination, 32-bit upper-layer length, zero and next header.
   inline void processPseudoHeader(uint32_t& sum, const uint32_t upperLayerLength) const {
      uint8_t pseudoHeader[40];
      memcpy(&pseudoHeader[0], &Data[8], 32);
      encodeUInt32(&pseudoHeader[32], upperLayerLength);
      encodeUInt32(&pseudoHeader[36], nextHeader());
      ::processInternet16(sum, pseudoHeader, sizeof(pseudoHeader));
   }

   inline const uint8_t* data() const {
      return Data;
   }
   inline size_t size() const {
      return sizeof(Data);
   }

   // NOTE: Extension headers are not supported. A packet with extension
   //       headers simply has a nextHeader() that is not of interest.
   friend std::istream& operator>>(std::istream& is, IPv6Header& header) {
      if(is.read(reinterpret_cast<char*>(header.Data), 40)) {
         if(header.version() != 6) {
            is.setstate(std::ios::failbit);
         }
      }
      return is;
   }

   inline friend std::ostream& operator<<(std::ostream& os, const IPv6Header& header) {
      return os.write(reinterpret_cast<const char*>(header.Data), sizeof(header.Data));
   }

   private:
   uint8_t Data[40];
};

#endif
