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

#include "internet16.h"
#include "byteorder.h"


// ###### Internet-16 checksum according to RFC 1071, computation part ######
// The data is summed up in network byte order. The sum is folded on every
// step, so that arbitrarily long inputs cannot overflow it.
void processInternet16(uint32_t& sum, const uint8_t* data, const size_t datalen)
{
   const uint8_t*       ptr = data;
   const uint8_t* const end = &data[datalen];

   // ------ Compute checksum in steps of 8 bytes ---------------------------
   while(ptr + 7 < end) {
      sum = sum +
         decodeUInt16(&ptr[0]) + decodeUInt16(&ptr[2]) +
         decodeUInt16(&ptr[4]) + decodeUInt16(&ptr[6]);
      sum = (sum >> 16) + (sum & 0xFFFF);
      ptr += 8;
   }

   // ------ Compute checksum in steps of 2 bytes ---------------------------
   while(ptr + 1 < end) {
      sum = sum + decodeUInt16(ptr);
      ptr += 2;
   }

   // ------ Handle a final byte (padded with a zero byte) ------------------
   if(ptr < end) {
      sum = sum + ((uint32_t)ptr[0] << 8);
   }
   sum = (sum >> 16) + (sum & 0xFFFF);
}
