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

#ifndef TCPHEADER_H
#define TCPHEADER_H

#include <string.h>

#include <istream>
#include <ostream>

#include "byteorder.h"
#include "internet16.h"


// ==========================================================================
// From RFC 9293:
//
//     0                   1                   2                   3
//     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |          Source Port          |       Destination Port        |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                        Sequence Number                        |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                    Acknowledgment Number                      |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |  Data |           |U|A|P|R|S|F|                               |
//    | Offset| Reserved  |R|C|S|S|Y|I|            Window             |
//    |       |           |G|K|H|T|N|N|                               |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |           Checksum            |         Urgent Pointer        |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                    Options                    |    Padding    |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                             data                              |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// ==========================================================================


enum TCPFlags
{
   TF_FIN = (1 << 0),
   TF_SYN = (1 << 1),
   TF_RST = (1 << 2),
   TF_PSH = (1 << 3),
   TF_ACK = (1 << 4),
   TF_URG = (1 << 5),
   TF_ECE = (1 << 6),
   TF_CWR = (1 << 7)
};

class TCPHeader
{
   public:
   TCPHeader() {
      memset(Data, 0, sizeof(Data));
      dataOffset(20);
   }

   inline uint16_t sourcePort()      const { return decodeUInt16(&Data[0]);  }
   inline uint16_t destinationPort() const { return decodeUInt16(&Data[2]);  }
   inline uint32_t seqNumber()       const { return decodeUInt32(&Data[4]);  }
   inline uint32_t ackNumber()       const { return decodeUInt32(&Data[8]);  }
   inline uint8_t  dataOffset()      const { return (Data[12] & 0xf0) >> 2;  }   // in bytes
   inline uint8_t  flags()           const { return Data[13];                }
   inline uint16_t window()          const { return decodeUInt16(&Data[14]); }
   inline uint16_t checksum()        const { return decodeUInt16(&Data[16]); }
   inline uint16_t urgentPointer()   const { return decodeUInt16(&Data[18]); }

   inline bool hasFlags(const uint8_t flags) const {
      return (Data[13] & flags) == flags;
   }

   inline void sourcePort(const uint16_t sourcePort)           { encodeUInt16(&Data[0], sourcePort);         }
   inline void destinationPort(const uint16_t destinationPort) { encodeUInt16(&Data[2], destinationPort);    }
   inline void seqNumber(const uint32_t seqNumber)             { encodeUInt32(&Data[4], seqNumber);          }
   inline void ackNumber(const uint32_t ackNumber)             { encodeUInt32(&Data[8], ackNumber);          }
   inline void dataOffset(const uint8_t dataOffset)            { Data[12] = ((dataOffset >> 2) & 0x0f) << 4; }   // in bytes
   inline void flags(const uint8_t flags)                      { Data[13] = flags;                           }
   inline void window(const uint16_t window)                   { encodeUInt16(&Data[14], window);            }
   inline void checksum(const uint16_t checksum)               { encodeUInt16(&Data[16], checksum);          }
   inline void urgentPointer(const uint16_t urgentPointer)     { encodeUInt16(&Data[18], urgentPointer);     }

   inline void processInternet16(uint32_t& sum) const {
      ::processInternet16(sum, Data, dataOffset());
   }

   inline const uint8_t* data() const {
      return Data;
   }
   inline size_t size() const {
      return dataOffset();
   }

   // ====== Read the first 8 bytes only ====================================
   // An ICMPv4 error is only guaranteed to quote ports and sequence number
   // of the original segment.
   inline std::istream& readQuoted(std::istream& is) {
      return is.read(reinterpret_cast<char*>(Data), 8);
   }

   friend std::istream& operator>>(std::istream& is, TCPHeader& header) {
      if(is.read(reinterpret_cast<char*>(header.Data), 20)) {
         const std::streamsize totalLength = header.dataOffset();
         if(totalLength < 20) {
            is.setstate(std::ios::failbit);
         }
         else if(totalLength > 20) {
            is.read(reinterpret_cast<char*>(header.Data) + 20, totalLength - 20);
         }
      }
      return is;
   }

   inline friend std::ostream& operator<<(std::ostream& os, const TCPHeader& header) {
      return os.write(reinterpret_cast<const char*>(header.Data), header.dataOffset());
   }

   private:
   uint8_t Data[60];
};

#endif
