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

#ifndef TOOLS_H
#define TOOLS_H

#include <chrono>
#include <sstream>
#include <string>

#include <boost/asio/ip/address.hpp>
#include <boost/format.hpp>


// ###### Internal invariant check, active in every build type ##############
#define assure(expression) \
   if(__builtin_expect(!(expression), 0)) { \
      rtraceAssureFail(#expression, __FILE__, __LINE__, __func__); \
   }

[[noreturn]] void rtraceAssureFail(const char*        expression,
                                   const char*        file,
                                   const unsigned int line,
                                   const char*        function);


// Probe and response timing uses the monotonic clock, time stamps written
// into probes use the system clock.
typedef std::chrono::steady_clock            TraceClock;
typedef TraceClock::time_point               TraceTimePoint;
typedef TraceClock::duration                 TraceDuration;
typedef std::chrono::system_clock            SystemClock;
typedef std::chrono::time_point<SystemClock> SystemTimePoint;


// ###### Microseconds since the clock's epoch ##############################
template<class TimePoint> inline uint64_t usSinceEpoch(const TimePoint& timePoint)
{
   return std::chrono::duration_cast<std::chrono::microseconds>(
             timePoint.time_since_epoch()).count();
}


// ###### Render a duration in milliseconds #################################
// A negative duration is a missing value, rendered as "*".
template <typename Duration>
std::string durationToString(const Duration& duration)
{
   const std::chrono::nanoseconds ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(duration);
   if(ns.count() < 0) {
      return "*";
   }
   return (boost::format("%1.3fms") % (ns.count() / 1000000.0)).str();
}


boost::asio::ip::address dropScopeID(const boost::asio::ip::address& address);
const char* addressFamilyName(const boost::asio::ip::address& address);

#endif
