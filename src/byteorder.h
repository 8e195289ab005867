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

#ifndef BYTEORDER_H
#define BYTEORDER_H

#include <stdint.h>


// ###### Network byte order accessors for wire-format headers ##############
inline uint16_t decodeUInt16(const uint8_t* data)
{
   return ((uint16_t)data[0] << 8) | (uint16_t)data[1];
}

inline uint32_t decodeUInt32(const uint8_t* data)
{
   return ((uint32_t)data[0] << 24) | ((uint32_t)data[1] << 16) |
          ((uint32_t)data[2] << 8)  | (uint32_t)data[3];
}

inline uint64_t decodeUInt64(const uint8_t* data)
{
   return ((uint64_t)decodeUInt32(data) << 32) | (uint64_t)decodeUInt32(&data[4]);
}

inline void encodeUInt16(uint8_t* data, const uint16_t value)
{
   data[0] = static_cast<uint8_t>(value >> 8);
   data[1] = static_cast<uint8_t>(value & 0xff);
}

inline void encodeUInt32(uint8_t* data, const uint32_t value)
{
   encodeUInt16(data,     static_cast<uint16_t>(value >> 16));
   encodeUInt16(&data[2], static_cast<uint16_t>(value & 0xffff));
}

inline void encodeUInt64(uint8_t* data, const uint64_t value)
{
   encodeUInt32(data,     static_cast<uint32_t>(value >> 32));
   encodeUInt32(&data[4], static_cast<uint32_t>(value & 0xffffffff));
}

#endif
