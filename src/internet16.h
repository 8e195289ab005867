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

#ifndef INTERNET16_H
#define INTERNET16_H

#include <stddef.h>
#include <stdint.h>


void processInternet16(uint32_t& sum, const uint8_t* data, const size_t datalen);


// ###### Internet-16 checksum according to RFC 1071, final part ############
inline uint16_t finishInternet16(uint32_t sum)
{
   while(sum >> 16) {
      sum = (sum >> 16) + (sum & 0xFFFF);
   }
   return static_cast<uint16_t>(~sum);
}

#endif
