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

#include <netinet/ip_icmp.h>

#include <iostream>

#include "tools.h"
#include "logger.h"
#include "probetracker.h"


static const boost::asio::ip::address Router1     = boost::asio::ip::make_address("203.0.113.1");
static const boost::asio::ip::address Router2     = boost::asio::ip::make_address("203.0.113.2");
static const boost::asio::ip::address Router2b    = boost::asio::ip::make_address("203.0.113.22");
static const boost::asio::ip::address Destination = boost::asio::ip::make_address("198.51.100.7");
static const SessionToken             Token(0x3000, 0x0abc0def);


// ###### Make configuration ################################################
static TraceConfiguration makeConfiguration(const ProtocolType protocol)
{
   TraceConfiguration configuration;
   configuration.setDestination(Destination);
   configuration.setSource("192.0.2.1");
   configuration.setProtocol(protocol);
   configuration.setFirstTTL(1);
   configuration.setMaxTTL(5);
   configuration.setProbesPerHop(2);
   configuration.setProbeTimeout(std::chrono::milliseconds(1000));
   configuration.setMaxInFlight(4);
   configuration.validate();
   return configuration;
}


// ###### Make a response to a probe ########################################
static ParsedPacket makeResponse(const IdentityScheme&           scheme,
                                 const unsigned int              ttl,
                                 const unsigned int              probeIndex,
                                 const ResponseType              type,
                                 const boost::asio::ip::address& responder,
                                 const TraceTimePoint&           receiveTime,
                                 const uint8_t                   icmpCode = 0)
{
   const ProbeFields fields =
      scheme.toProbeFields(scheme.makeIdentity(ttl, probeIndex), SystemClock::now());
   ParsedPacket parsedPacket;
   parsedPacket.Type                = type;
   parsedPacket.ICMPCode            = icmpCode;
   parsedPacket.ResponderAddress    = responder;
   parsedPacket.OriginalDestination = Destination;
   parsedPacket.Identifier          = fields.Identifier;
   parsedPacket.Marker              = fields.Marker;
   parsedPacket.HasProbeHeader      = (type != RT_TCPResponse);
   parsedPacket.MagicNumber         = fields.MagicNumber;
   parsedPacket.ReceiveTime         = receiveTime;
   if(type == RT_TCPResponse) {
      parsedPacket.Marker += 44;   // Acknowledged payload
   }
   return parsedPacket;
}


// ###### Send the next probe ###############################################
static void sendNext(ProbeTracker&         tracker,
                     const unsigned int    expectedTTL,
                     const unsigned int    expectedProbeIndex,
                     const TraceTimePoint& sendTime)
{
   unsigned int ttl;
   unsigned int probeIndex;
   assure(tracker.nextProbe(ttl, probeIndex));
   assure(ttl == expectedTTL);
   assure(probeIndex == expectedProbeIndex);
   tracker.probeSent(ttl, probeIndex, sendTime);
}


// ###### Dispatch order and in-flight limit ################################
static void testDispatch()
{
   const TraceConfiguration configuration = makeConfiguration(PT_UDP);
   const IdentityScheme     scheme(PT_UDP, Token, 1, 5, 2);
   ProbeTracker             tracker(configuration, scheme);
   const TraceTimePoint     t0 = TraceClock::now();

   sendNext(tracker, 1, 0, t0);
   sendNext(tracker, 1, 1, t0);
   sendNext(tracker, 2, 0, t0);
   sendNext(tracker, 2, 1, t0);
   assure(tracker.pendingCount() == 4);

   unsigned int ttl;
   unsigned int probeIndex;
   assure(!tracker.nextProbe(ttl, probeIndex));
   assure(!tracker.dispatchFinished());

   TraceTimePoint expiry;
   assure(tracker.nextExpiry(expiry));
   assure(expiry == t0 + std::chrono::milliseconds(1000));

   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_TimeExceeded, Router1,
                                              t0 + std::chrono::milliseconds(5))) == MR_Matched);
   sendNext(tracker, 3, 0, t0 + std::chrono::milliseconds(5));

   tracker.stopDispatching();
   assure(tracker.dispatchFinished());
   assure(!tracker.nextProbe(ttl, probeIndex));
}


// ###### A complete trace ##################################################
static void testCompleteTrace()
{
   const TraceConfiguration configuration = makeConfiguration(PT_UDP);
   const IdentityScheme     scheme(PT_UDP, Token, 1, 5, 2);
   ProbeTracker             tracker(configuration, scheme);
   const TraceTimePoint     t0 = TraceClock::now();
   const std::chrono::milliseconds ms(1);

   sendNext(tracker, 1, 0, t0);
   sendNext(tracker, 1, 1, t0 + 1 * ms);
   sendNext(tracker, 2, 0, t0 + 2 * ms);
   sendNext(tracker, 2, 1, t0 + 3 * ms);

   // Hop 2 answers first, but hop 1 is finalised first:
   assure(tracker.handleResponse(makeResponse(scheme, 2, 0, RT_TimeExceeded, Router2, t0 + 20 * ms)) == MR_Matched);
   assure(tracker.handleResponse(makeResponse(scheme, 2, 1, RT_TimeExceeded, Router2b, t0 + 21 * ms)) == MR_Matched);
   assure(tracker.finalizedCount() == 0);
   assure(tracker.handleResponse(makeResponse(scheme, 1, 1, RT_TimeExceeded, Router1, t0 + 11 * ms)) == MR_Matched);
   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_TimeExceeded, Router1, t0 + 10 * ms)) == MR_Matched);
   assure(tracker.finalizedCount() == 2);

   // Duplicate:
   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_TimeExceeded, Router1, t0 + 12 * ms)) == MR_NotPending);

   sendNext(tracker, 3, 0, t0 + 30 * ms);
   sendNext(tracker, 3, 1, t0 + 31 * ms);
   sendNext(tracker, 4, 0, t0 + 32 * ms);
   sendNext(tracker, 4, 1, t0 + 33 * ms);

   // The destination answers for TTL 4 first, then for TTL 3:
   assure(tracker.handleResponse(makeResponse(scheme, 4, 0, RT_Unreachable, Destination,
                                              t0 + 40 * ms, ICMP_UNREACH_PORT)) == MR_Matched);
   assure(tracker.lastHop() == 4);
   assure(tracker.destinationReached());
   assure(tracker.handleResponse(makeResponse(scheme, 3, 0, RT_Unreachable, Destination,
                                              t0 + 41 * ms, ICMP_UNREACH_PORT)) == MR_Matched);
   assure(tracker.lastHop() == 3);
   assure(tracker.dispatchFinished());
   assure(tracker.pendingCount() == 1);   // TTL 3, probe 1

   // Probes beyond the destination are gone:
   assure(tracker.handleResponse(makeResponse(scheme, 4, 1, RT_Unreachable, Destination,
                                              t0 + 42 * ms, ICMP_UNREACH_PORT)) == MR_NotPending);
   assure(!tracker.complete());

   assure(tracker.expireProbes(t0 + 500 * ms) == 0);
   assure(tracker.expireProbes(t0 + 31 * ms + std::chrono::milliseconds(1000)) == 1);
   assure(tracker.complete());
   assure(tracker.pendingCount() == 0);

   const TraceResult result = tracker.finish(TS_ReachedDestination, SystemClock::now(), 100 * ms);
   assure(result.status() == TS_ReachedDestination);
   assure(result.size() == 3);
   assure(result.firstTTL() == 1);
   assure(result.lastTTL() == 3);
   assure(result.destination() == Destination);
   assure(result.protocol() == PT_UDP);

   const HopRecord& hop1 = result[0];
   assure(hop1.ttl() == 1);
   assure(hop1.observations().size() == 2);
   assure(hop1.observations()[0].probeIndex() == 0);
   assure(hop1.observations()[0].rtt() == 10 * ms);
   assure(hop1.observations()[1].rtt() == 10 * ms);
   assure(hop1.observations()[0].status() == TimeExceeded);
   assure(hop1.addresses().size() == 1);
   assure(hop1.minRTT() == 10 * ms);
   assure(!hop1.destinationReached());

   // Load balancing: two routers at hop 2
   const HopRecord* hop2 = result.hopForTTL(2);
   assure(hop2 != nullptr);
   assure(hop2->addresses().size() == 2);
   assure(hop2->minRTT() == 18 * ms);
   assure(hop2->maxRTT() == 18 * ms);

   const HopRecord* hop3 = result.hopForTTL(3);
   assure(hop3 != nullptr);
   assure(hop3->destinationReached());
   assure(hop3->observations().size() == 2);
   assure(hop3->observations()[0].classification() == OC_DestinationReached);
   assure(hop3->observations()[0].status() == Success);
   assure(hop3->observations()[0].rtt() == 11 * ms);
   assure(hop3->observations()[1].isExpired());
   assure(hop3->observations()[1].status() == Timeout);
   assure(hop3->expiredCount() == 1);
   assure(hop3->rttSamples().size() == 1);

   assure(result.hopForTTL(4) == nullptr);
   assure(result.hopForTTL(0) == nullptr);
}


// ###### Responses that do not belong to the trace #########################
static void testUnrelatedResponses()
{
   const TraceConfiguration configuration = makeConfiguration(PT_ICMP);
   const IdentityScheme     scheme(PT_ICMP, Token, 1, 5, 2);
   ProbeTracker             tracker(configuration, scheme);
   const TraceTimePoint     t0 = TraceClock::now();

   sendNext(tracker, 1, 0, t0);

   // Another session:
   ParsedPacket parsedPacket = makeResponse(scheme, 1, 0, RT_TimeExceeded, Router1, t0);
   parsedPacket.Identifier++;
   assure(tracker.handleResponse(parsedPacket) == MR_Unrelated);

   // Same identifier, another magic number:
   parsedPacket = makeResponse(scheme, 1, 0, RT_TimeExceeded, Router1, t0);
   parsedPacket.MagicNumber++;
   assure(tracker.handleResponse(parsedPacket) == MR_Unrelated);

   // Probe to another destination:
   parsedPacket = makeResponse(scheme, 1, 0, RT_TimeExceeded, Router1, t0);
   parsedPacket.OriginalDestination = boost::asio::ip::make_address("198.51.100.8");
   assure(tracker.handleResponse(parsedPacket) == MR_Unrelated);

   // Echo Reply from another host:
   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_EchoReply, Router1, t0)) == MR_Unrelated);

   // Not sent yet:
   assure(tracker.handleResponse(makeResponse(scheme, 2, 0, RT_TimeExceeded, Router2, t0)) == MR_NotPending);

   assure(tracker.pendingCount() == 1);

   // Echo Reply from the destination, at TTL 1:
   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_EchoReply, Destination,
                                              t0 + std::chrono::milliseconds(3))) == MR_Matched);
   assure(tracker.lastHop() == 1);
   assure(tracker.dispatchFinished() == false);   // Probe 1 of TTL 1 still to be sent
   sendNext(tracker, 1, 1, t0);
   assure(tracker.dispatchFinished());
}


// ###### Unreachable routers ###############################################
static void testUnreachable()
{
   const TraceConfiguration configuration = makeConfiguration(PT_UDP);
   const IdentityScheme     scheme(PT_UDP, Token, 1, 5, 2);
   ProbeTracker             tracker(configuration, scheme);
   const TraceTimePoint     t0 = TraceClock::now();

   sendNext(tracker, 1, 0, t0);
   sendNext(tracker, 1, 1, t0);
   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_Unreachable, Router1,
                                              t0, ICMP_UNREACH_HOST)) == MR_Matched);
   assure(tracker.handleResponse(makeResponse(scheme, 1, 1, RT_Unreachable, Router1,
                                              t0, ICMP_UNREACH_FILTER_PROHIB)) == MR_Matched);
   // A router's verdict does not end the trace:
   assure(!tracker.destinationReached());
   assure(!tracker.dispatchFinished());
   assure(!tracker.complete());

   const TraceResult result = tracker.finish(TS_Aborted, SystemClock::now(), TraceDuration(0));
   assure(result.size() == 1);
   assure(result[0].observations()[0].classification() == OC_Unreachable);
   assure(result[0].observations()[0].status() == UnreachableHost);
   assure(result[0].observations()[1].status() == UnreachableProhibited);
   assure(statusIsUnreachable(result[0].observations()[1].status()));
   assure(result[0].observations()[0].rtt() == TraceDuration(0));
}


// ###### Maximum TTL without reaching the destination ######################
static void testMaxTTLExceeded()
{
   TraceConfiguration configuration = makeConfiguration(PT_TCP);
   configuration.setMaxTTL(2);
   const IdentityScheme scheme(PT_TCP, Token, 1, 2, 2);
   ProbeTracker         tracker(configuration, scheme);
   const TraceTimePoint t0 = TraceClock::now();

   sendNext(tracker, 1, 0, t0);
   sendNext(tracker, 1, 1, t0);
   sendNext(tracker, 2, 0, t0);
   sendNext(tracker, 2, 1, t0);
   assure(tracker.dispatchFinished());

   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_TimeExceeded, Router1, t0)) == MR_Matched);
   assure(tracker.expireProbes(t0 + std::chrono::milliseconds(1000)) == 3);
   assure(tracker.complete());
   assure(!tracker.destinationReached());

   const TraceResult result = tracker.finish(TS_MaxTTLExceeded, SystemClock::now(), TraceDuration(0));
   assure(result.size() == 2);
   assure(result[1].expiredCount() == 2);
   assure(result[1].addresses().empty());
   assure(result[1].minRTT() < TraceDuration::zero());
}


// ###### TCP responses from the destination ################################
static void testTCPDestination()
{
   const TraceConfiguration configuration = makeConfiguration(PT_TCP);
   const IdentityScheme     scheme(PT_TCP, Token, 1, 5, 2);
   ProbeTracker             tracker(configuration, scheme);
   const TraceTimePoint     t0 = TraceClock::now();

   sendNext(tracker, 1, 0, t0);
   sendNext(tracker, 1, 1, t0);
   sendNext(tracker, 2, 0, t0);
   assure(tracker.handleResponse(makeResponse(scheme, 1, 1, RT_TCPResponse, Destination, t0)) == MR_Matched);
   assure(tracker.lastHop() == 1);
   assure(tracker.pendingCount() == 1);   // TTL 2 discarded
   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_TCPResponse, Destination, t0)) == MR_Matched);
   assure(tracker.complete());

   const TraceResult result = tracker.finish(TS_ReachedDestination, SystemClock::now(), TraceDuration(0));
   assure(result.size() == 1);
   assure(result[0].destinationReached());
   assure(result[0].observations()[0].status() == Success);
}


// ###### Responses after the probe timeout #################################
static void testLateResponse()
{
   const TraceConfiguration configuration = makeConfiguration(PT_UDP);
   const IdentityScheme     scheme(PT_UDP, Token, 1, 5, 2);
   ProbeTracker             tracker(configuration, scheme);
   const TraceTimePoint     t0 = TraceClock::now();
   const std::chrono::milliseconds ms(1);

   sendNext(tracker, 1, 0, t0);
   sendNext(tracker, 1, 1, t0 + 1 * ms);
   sendNext(tracker, 2, 0, t0 + 2 * ms);
   sendNext(tracker, 2, 1, t0 + 3 * ms);

   assure(tracker.handleResponse(makeResponse(scheme, 1, 0, RT_TimeExceeded, Router1, t0 + 100 * ms)) == MR_Matched);

   // Received long after the 1000 ms timeout, and exactly at it:
   assure(tracker.handleResponse(makeResponse(scheme, 1, 1, RT_TimeExceeded, Router1, t0 + 10000 * ms)) == MR_NotPending);
   assure(tracker.handleResponse(makeResponse(scheme, 1, 1, RT_TimeExceeded, Router1, t0 + 1001 * ms)) == MR_NotPending);
   assure(tracker.pendingCount() == 3);
   assure(tracker.finalizedCount() == 0);

   assure(tracker.handleResponse(makeResponse(scheme, 2, 0, RT_TimeExceeded, Router2, t0 + 102 * ms)) == MR_Matched);
   assure(tracker.handleResponse(makeResponse(scheme, 2, 1, RT_TimeExceeded, Router2, t0 + 203 * ms)) == MR_Matched);

   // The late probe only expires:
   assure(tracker.expireProbes(t0 + 1001 * ms) == 1);
   assure(tracker.finalizedCount() == 2);
   assure(tracker.handleResponse(makeResponse(scheme, 1, 1, RT_TimeExceeded, Router1, t0 + 999 * ms)) == MR_NotPending);

   const TraceResult result = tracker.finish(TS_DeadlineExceeded, SystemClock::now(), 2000 * ms);
   assure(result.size() == 2);

   const HopRecord& hop1 = result[0];
   assure(hop1.observations().size() == 2);
   assure(hop1.observations()[0].rtt() == 100 * ms);
   assure(hop1.observations()[1].isExpired());
   assure(hop1.rttSamples().size() == 1);
   assure(hop1.avgRTT() == 100 * ms);

   const HopRecord& hop2 = result[1];
   assure(hop2.expiredCount() == 0);
   assure(hop2.minRTT() == 100 * ms);
   assure(hop2.avgRTT() == 150 * ms);
   assure(hop2.maxRTT() == 200 * ms);
}


// ###### Main program ######################################################
int main(int argc, char** argv)
{
   initialiseLogger(boost::log::trivial::severity_level::warning, false);

   testDispatch();
   testCompleteTrace();
   testUnrelatedResponses();
   testUnreachable();
   testMaxTTLExceeded();
   testTCPDestination();
   testLateResponse();

   std::cout << "Probe tracker tests passed\n";
   return 0;
}
