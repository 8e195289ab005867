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

#ifndef TRACEROUTE_H
#define TRACEROUTE_H

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include "packetcodec.h"
#include "probeidentity.h"
#include "probetracker.h"
#include "traceconfiguration.h"
#include "traceresult.h"
#include "transport.h"


// ###### Traceroute ########################################################
// Runs one trace over a caller-supplied transport. run() blocks until the
// trace has completed, hit its deadline or has been cancelled by
// requestStop(). A Traceroute object runs a single trace only.
class Traceroute
{
   public:
   Traceroute(const TraceConfiguration& configuration,
              TransportChannel&         transport,
              const SessionToken&       sessionToken = SessionToken::random());
   ~Traceroute();

   inline const TraceConfiguration& getConfiguration() const {
      return Configuration;
   }
   inline const SessionToken& getSessionToken() const {
      return Scheme.sessionToken();
   }

   TraceResult run();
   void        requestStop();

   protected:
   void receiverLoop();
   void handlePacket(const std::shared_ptr<ReceivedPacket>& receivedPacket);
   void sendProbes();
   void scheduleIntervalEvent(const TraceTimePoint& when);
   void handleIntervalEvent(const boost::system::error_code& errorCode);
   void scheduleTimeoutEvent();
   void handleTimeoutEvent(const boost::system::error_code& errorCode);
   void handleDeadlineEvent(const boost::system::error_code& errorCode);
   void handleStopRequest();
   void handleGraceEvent(const boost::system::error_code& errorCode);
   void checkCompletion();
   void finish(const TraceStatus status);

   const TraceConfiguration      Configuration;
   TransportChannel&             Transport;
   const IdentityScheme          Scheme;
   const PacketCodec             Codec;

   boost::asio::io_context       IOContext;
   boost::asio::steady_timer     IntervalTimer;
   boost::asio::steady_timer     TimeoutTimer;
   boost::asio::steady_timer     DeadlineTimer;
   boost::asio::steady_timer     GraceTimer;
   std::atomic<bool>             StopRequested;
   std::atomic<bool>             ReceiverStopRequested;

   std::unique_ptr<ProbeTracker> Tracker;
   std::unique_ptr<TraceResult>  Result;
   bool                          IntervalScheduled;
   bool                          Stopping;
   bool                          Finished;
   bool                          SendFailed;
   boost::system::error_code     SendErrorCode;
   SystemTimePoint               StartTime;
   TraceTimePoint                StartTimePoint;
   TraceTimePoint                LastSendTime;
};

#endif
