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

#ifndef PROBEHEADER_H
#define PROBEHEADER_H

#include <stdint.h>
#include <string.h>

#include <istream>
#include <ostream>

#include "byteorder.h"
#include "internet16.h"


// ==========================================================================
// Format (at the beginning of every probe's payload):
// 00 4 MagicNumber
// 04 1 SendTTL
// 05 1 Probe Index
// 06 2 Ordinal
// 08 8 Send Time Stamp (microseconds since 1970-01-01, system clock)
// ==========================================================================

#define PROBE_HEADER_SIZE 16

class ProbeHeader
{
   public:
   ProbeHeader() {
      memset(Data, 0, sizeof(Data));
   }

   inline uint32_t magicNumber()   const { return decodeUInt32(&Data[0]); }
   inline uint8_t  sendTTL()       const { return Data[4];                }
   inline uint8_t  probeIndex()    const { return Data[5];                }
   inline uint16_t ordinal()       const { return decodeUInt16(&Data[6]); }
   inline uint64_t sendTimeStamp() const { return decodeUInt64(&Data[8]); }

   inline void magicNumber(const uint32_t magicNumber)     { encodeUInt32(&Data[0], magicNumber);   }
   inline void sendTTL(const uint8_t sendTTL)              { Data[4] = sendTTL;                     }
   inline void probeIndex(const uint8_t probeIndex)        { Data[5] = probeIndex;                  }
   inline void ordinal(const uint16_t ordinal)             { encodeUInt16(&Data[6], ordinal);       }
   inline void sendTimeStamp(const uint64_t sendTimeStamp) { encodeUInt64(&Data[8], sendTimeStamp); }

   inline void processInternet16(uint32_t& sum) const {
      ::processInternet16(sum, Data, sizeof(Data));
   }

   inline const uint8_t* data() const {
      return Data;
   }
   inline size_t size() const {
      return sizeof(Data);
   }

   inline friend std::istream& operator>>(std::istream& is, ProbeHeader& header) {
      return is.read(reinterpret_cast<char*>(header.Data), sizeof(header.Data));
   }

   inline friend std::ostream& operator<<(std::ostream& os, const ProbeHeader& header) {
      return os.write(reinterpret_cast<const char*>(header.Data), sizeof(header.Data));
   }

   private:
   uint8_t Data[PROBE_HEADER_SIZE];
};

#endif
