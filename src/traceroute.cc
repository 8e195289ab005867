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

#include "traceroute.h"
#include "tools.h"
#include "logger.h"
#include "traceexception.h"

#include <functional>


// Bound of a single blocking receive call, i.e. the reaction time of the
// receiver thread on the end of the trace.
static const std::chrono::milliseconds ReceivePollInterval(50);


// ###### Check configuration before anything else is set up ################
static const TraceConfiguration& validateConfiguration(const TraceConfiguration& configuration)
{
   configuration.validate();
   return configuration;
}


// ###### Constructor #######################################################
Traceroute::Traceroute(const TraceConfiguration& configuration,
                       TransportChannel&         transport,
                       const SessionToken&       sessionToken)
   : Configuration(validateConfiguration(configuration)),
     Transport(transport),
     Scheme(Configuration.getProtocol(), sessionToken,
            Configuration.getFirstTTL(), Configuration.getMaxTTL(),
            Configuration.getProbesPerHop(), Configuration.getUDPBasePort()),
     Codec(Configuration.getProtocol(),
           Configuration.getSource(), Configuration.getDestination(),
           Configuration.getTCPPort(), Configuration.getTrafficClass()),
     IntervalTimer(IOContext),
     TimeoutTimer(IOContext),
     DeadlineTimer(IOContext),
     GraceTimer(IOContext),
     StopRequested(false),
     ReceiverStopRequested(false)
{
   if( (Configuration.getProtocol() != PT_ICMP) && (sessionToken.Identifier == 0) ) {
      throw ConfigurationError("Session identifier 0 is not a valid source port");
   }
   IntervalScheduled = false;
   Stopping          = false;
   Finished          = false;
   SendFailed        = false;
}


// ###### Destructor ########################################################
Traceroute::~Traceroute()
{
}


// ###### Request stop of the trace #########################################
// May be called from any thread, also before run().
void Traceroute::requestStop()
{
   if(StopRequested.exchange(true) == false) {
      boost::asio::post(IOContext, std::bind(&Traceroute::handleStopRequest, this));
   }
}


// ###### Run the trace #####################################################
TraceResult Traceroute::run()
{
   if(Tracker) {
      throw TraceException("The trace has already been run");
   }
   Tracker = std::unique_ptr<ProbeTracker>(new ProbeTracker(Configuration, Scheme));

   StartTime      = SystemClock::now();
   StartTimePoint = TraceClock::now();
   LastSendTime   = StartTimePoint - Configuration.getSendInterval();
   RTRACE_LOG(info) << "Starting " << Configuration
                    << ", session " << Scheme.sessionToken();

   // ====== Schedule deadline and first probe ==============================
   DeadlineTimer.expires_at(StartTimePoint + Configuration.getTraceDeadline());
   DeadlineTimer.async_wait(std::bind(&Traceroute::handleDeadlineEvent, this,
                                      std::placeholders::_1));
   boost::asio::post(IOContext, std::bind(&Traceroute::sendProbes, this));

   // ====== Run event loop, with reception in its own thread ===============
   ReceiverStopRequested = false;
   std::thread receiverThread(&Traceroute::receiverLoop, this);
   try {
      IOContext.run();
   }
   catch(const std::exception& e) {
      RTRACE_LOG(error) << "Trace to " << Configuration.getDestination()
                        << " failed: " << e.what();
      ReceiverStopRequested = true;
      receiverThread.join();
      throw;
   }
   ReceiverStopRequested = true;
   receiverThread.join();

   // ====== Report outcome =================================================
   if(SendFailed) {
      throw SendError("Unable to send probe to " + Configuration.getDestination().to_string(),
                      SendErrorCode);
   }
   assure(Result);
   TraceResult traceResult(std::move(*Result));
   Result.reset();
   return traceResult;
}


// ###### Receiver thread ###################################################
void Traceroute::receiverLoop()
{
   try {
      while(!ReceiverStopRequested) {
         std::shared_ptr<ReceivedPacket> receivedPacket = std::make_shared<ReceivedPacket>();
         if(Transport.receive(TraceClock::now() + ReceivePollInterval, *receivedPacket)) {
            boost::asio::post(IOContext, std::bind(&Traceroute::handlePacket, this,
                                                   receivedPacket));
         }
      }
   }
   catch(const std::exception& e) {
      // Hand the failure over to the event loop, which lets run() fail:
      const std::string error = e.what();
      boost::asio::post(IOContext, [error]() {
         throw TraceException("Receiving failed: " + error);
      });
   }
}


// ###### Handle an inbound packet ##########################################
void Traceroute::handlePacket(const std::shared_ptr<ReceivedPacket>& receivedPacket)
{
   if(Finished) {
      return;
   }

   ParsedPacket       parsedPacket;
   const DecodeStatus decodeStatus =
      Codec.decodeResponse(receivedPacket->Data.data(), receivedPacket->Data.size(),
                           receivedPacket->ReceiveTime, parsedPacket);
   if(decodeStatus != DS_Success) {
      RTRACE_LOG(trace) << "Discarding " << receivedPacket->Data.size() << " B packet: "
                        << getDecodeStatusName(decodeStatus);
      return;
   }

   if(Tracker->handleResponse(parsedPacket) == MR_Matched) {
      scheduleTimeoutEvent();
      if(!IntervalScheduled) {
         sendProbes();
      }
      checkCompletion();
   }
}


// ###### Send probes #######################################################
void Traceroute::sendProbes()
{
   if(Finished) {
      return;
   }

   unsigned int ttl;
   unsigned int probeIndex;
   if(!Tracker->nextProbe(ttl, probeIndex)) {
      // Either all probes are sent, or the in-flight limit is reached. In
      // the latter case, the next resolved probe triggers sending again.
      checkCompletion();
      return;
   }

   // ====== Pacing =========================================================
   const TraceTimePoint now = TraceClock::now();
   if(now < LastSendTime + Configuration.getSendInterval()) {
      scheduleIntervalEvent(LastSendTime + Configuration.getSendInterval());
      return;
   }

   // ====== Encode and send probe ==========================================
   const ProbeIdentity        identity = Scheme.makeIdentity(ttl, probeIndex);
   const ProbeFields          fields   = Scheme.toProbeFields(identity, SystemClock::now());
   const std::vector<uint8_t> packet   = Codec.encodeProbe(ttl, fields,
                                                           Configuration.getPayloadSize());
   boost::system::error_code  errorCode;
   const TraceTimePoint       sendTime = TraceClock::now();
   Transport.send(packet, Configuration.getDestination(), errorCode);
   if(errorCode) {
      RTRACE_LOG(error) << "Unable to send probe " << identity << " with TTL " << ttl
                        << " to " << Configuration.getDestination()
                        << ": " << errorCode.message();
      SendFailed    = true;
      SendErrorCode = errorCode;
      finish(TS_Aborted);
      return;
   }
   Tracker->probeSent(ttl, probeIndex, sendTime);
   LastSendTime = sendTime;

   scheduleTimeoutEvent();
   scheduleIntervalEvent(LastSendTime + Configuration.getSendInterval());
}


// ###### Schedule interval timer ###########################################
void Traceroute::scheduleIntervalEvent(const TraceTimePoint& when)
{
   IntervalScheduled = true;
   IntervalTimer.expires_at(when);
   IntervalTimer.async_wait(std::bind(&Traceroute::handleIntervalEvent, this,
                                      std::placeholders::_1));
}


// ###### Handle interval timer event #######################################
void Traceroute::handleIntervalEvent(const boost::system::error_code& errorCode)
{
   if(errorCode == boost::asio::error::operation_aborted) {
      return;
   }
   IntervalScheduled = false;
   sendProbes();
}


// ###### Schedule timeout timer for the earliest pending probe #############
void Traceroute::scheduleTimeoutEvent()
{
   TraceTimePoint expiryTime;
   if(Tracker->nextExpiry(expiryTime)) {
      TimeoutTimer.expires_at(expiryTime);
      TimeoutTimer.async_wait(std::bind(&Traceroute::handleTimeoutEvent, this,
                                        std::placeholders::_1));
   }
   else {
      TimeoutTimer.cancel();
   }
}


// ###### Handle timeout timer event ########################################
void Traceroute::handleTimeoutEvent(const boost::system::error_code& errorCode)
{
   if( (errorCode == boost::asio::error::operation_aborted) || (Finished) ) {
      return;
   }
   Tracker->expireProbes(TraceClock::now());
   scheduleTimeoutEvent();
   if(!IntervalScheduled) {
      sendProbes();
   }
   checkCompletion();
}


// ###### Handle trace deadline #############################################
void Traceroute::handleDeadlineEvent(const boost::system::error_code& errorCode)
{
   if( (errorCode == boost::asio::error::operation_aborted) || (Finished) ) {
      return;
   }
   RTRACE_LOG(info) << "Trace to " << Configuration.getDestination()
                    << " exceeded its deadline of "
                    << durationToString<std::chrono::milliseconds>(Configuration.getTraceDeadline());
   finish(TS_DeadlineExceeded);
}


// ###### Handle stop request ###############################################
void Traceroute::handleStopRequest()
{
   if( (Finished) || (Stopping) ) {
      return;
   }
   RTRACE_LOG(info) << "Cancelling trace to " << Configuration.getDestination();
   Stopping = true;
   Tracker->stopDispatching();
   IntervalTimer.cancel();
   IntervalScheduled = false;

   // ====== Drain responses of already sent probes =========================
   if(Tracker->pendingCount() == 0) {
      finish(TS_Aborted);
   }
   else {
      GraceTimer.expires_after(Configuration.getCancelGracePeriod());
      GraceTimer.async_wait(std::bind(&Traceroute::handleGraceEvent, this,
                                      std::placeholders::_1));
   }
}


// ###### Handle end of the cancellation grace period #######################
void Traceroute::handleGraceEvent(const boost::system::error_code& errorCode)
{
   if( (errorCode == boost::asio::error::operation_aborted) || (Finished) ) {
      return;
   }
   finish(TS_Aborted);
}


// ###### Check whether the trace is complete ###############################
void Traceroute::checkCompletion()
{
   if(Finished) {
      return;
   }
   if(Stopping) {
      if(Tracker->pendingCount() == 0) {
         finish(TS_Aborted);
      }
   }
   else if(Tracker->complete()) {
      finish((Tracker->destinationReached()) ? TS_ReachedDestination : TS_MaxTTLExceeded);
   }
}


// ###### Finish the trace ##################################################
void Traceroute::finish(const TraceStatus status)
{
   if(Finished) {
      return;
   }
   Finished = true;

   IntervalTimer.cancel();
   TimeoutTimer.cancel();
   DeadlineTimer.cancel();
   GraceTimer.cancel();

   const TraceDuration duration = TraceClock::now() - StartTimePoint;
   Result = std::unique_ptr<TraceResult>(
               new TraceResult(Tracker->finish(status, StartTime, duration)));
   RTRACE_LOG(info) << "Finished trace to " << Configuration.getDestination()
                    << ": " << getTraceStatusName(status)
                    << " after " << Result->size() << " hops";
   RTRACE_LOG(debug) << *Result;

   IOContext.stop();
}
