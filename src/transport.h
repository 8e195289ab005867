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

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <stdint.h>

#include <vector>

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

#include "tools.h"


// An inbound datagram, including its IP header
struct ReceivedPacket
{
   std::vector<uint8_t> Data;
   TraceTimePoint       ReceiveTime;
};


// ###### Transport channel #################################################
// The raw send/receive capability supplied by the caller. The engine calls
// send() from its dispatch path and receive() from its reception thread,
// i.e. both may be called concurrently. There is only one reader.
class TransportChannel
{
   public:
   virtual ~TransportChannel() { }

   // Sends a complete IP datagram (IP header included, TTL already set).
   // A failure is reported in errorCode; it aborts the trace.
   virtual void send(const std::vector<uint8_t>&       packet,
                     const boost::asio::ip::address&   destination,
                     boost::system::error_code&        errorCode) = 0;

   // Waits for the next inbound datagram until the deadline. Returns false
   // if the deadline has passed without any packet. Unrelated traffic is
   // delivered as well; the engine filters it.
   virtual bool receive(const TraceTimePoint& deadline,
                        ReceivedPacket&       receivedPacket) = 0;
};

#endif
