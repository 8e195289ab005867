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

#include "traceconfiguration.h"
#include "logger.h"
#include "probeidentity.h"
#include "traceexception.h"
#include "tools.h"

#include <fstream>

#include <boost/format.hpp>
#include <boost/program_options.hpp>


// ###### Constructor #######################################################
TraceConfiguration::TraceConfiguration()
   : Protocol(PT_UDP),
     FirstTTL(1),
     MaxTTL(30),
     ProbesPerHop(3),
     ProbeTimeout(3000),
     TraceDeadline(60000),
     PayloadSize(64),
     UDPBasePort(33434),
     TCPPort(80),
     TrafficClass(0),
     SendInterval(10),
     MaxInFlight(16),
     CancelGracePeriod(250)
{
}


// ###### Destructor ########################################################
TraceConfiguration::~TraceConfiguration()
{
}


// ###### Set destination ###################################################
void TraceConfiguration::setDestination(const boost::asio::ip::address& destination)
{
   if(destination.is_unspecified()) {
      throw ConfigurationError("Destination address must be specified");
   }
   Destination = dropScopeID(destination);
}


// ###### Set destination ###################################################
void TraceConfiguration::setDestination(const std::string& destination)
{
   boost::system::error_code errorCode;
   const boost::asio::ip::address address = boost::asio::ip::make_address(destination, errorCode);
   if(errorCode) {
      throw ConfigurationError("Invalid destination address " + destination);
   }
   setDestination(address);
}


// ###### Set source ########################################################
void TraceConfiguration::setSource(const boost::asio::ip::address& source)
{
   Source = dropScopeID(source);
}


// ###### Set source ########################################################
void TraceConfiguration::setSource(const std::string& source)
{
   if(source.empty()) {
      Source = boost::asio::ip::address();
      return;
   }
   boost::system::error_code errorCode;
   const boost::asio::ip::address address = boost::asio::ip::make_address(source, errorCode);
   if(errorCode) {
      throw ConfigurationError("Invalid source address " + source);
   }
   setSource(address);
}


// ###### Set protocol ######################################################
void TraceConfiguration::setProtocol(const ProtocolType protocol)
{
   Protocol = protocol;
}


// ###### Set protocol ######################################################
void TraceConfiguration::setProtocol(const std::string& protocolName)
{
   ProtocolType protocol;
   if(!getProtocolType(protocolName, protocol)) {
      throw ConfigurationError("Invalid protocol " + protocolName);
   }
   setProtocol(protocol);
}


// ###### Set first TTL #####################################################
void TraceConfiguration::setFirstTTL(const unsigned int firstTTL)
{
   if( (firstTTL < 1) || (firstTTL > 255) ) {
      throw ConfigurationError(str(boost::format("Invalid first TTL %u") % firstTTL));
   }
   FirstTTL = firstTTL;
}


// ###### Set maximum TTL ###################################################
void TraceConfiguration::setMaxTTL(const unsigned int maxTTL)
{
   if( (maxTTL < 1) || (maxTTL > 255) ) {
      throw ConfigurationError(str(boost::format("Invalid maximum TTL %u") % maxTTL));
   }
   MaxTTL = maxTTL;
}


// ###### Set probes per hop ################################################
void TraceConfiguration::setProbesPerHop(const unsigned int probesPerHop)
{
   if( (probesPerHop < 1) || (probesPerHop > 255) ) {
      throw ConfigurationError(str(boost::format("Invalid number of probes per hop %u") % probesPerHop));
   }
   ProbesPerHop = probesPerHop;
}


// ###### Set probe timeout #################################################
void TraceConfiguration::setProbeTimeout(const std::chrono::milliseconds& probeTimeout)
{
   if(probeTimeout.count() <= 0) {
      throw ConfigurationError("Probe timeout must be positive");
   }
   ProbeTimeout = probeTimeout;
}


// ###### Set trace deadline ################################################
void TraceConfiguration::setTraceDeadline(const std::chrono::milliseconds& traceDeadline)
{
   if(traceDeadline.count() <= 0) {
      throw ConfigurationError("Trace deadline must be positive");
   }
   TraceDeadline = traceDeadline;
}


// ###### Set payload size ##################################################
void TraceConfiguration::setPayloadSize(const size_t payloadSize)
{
   if(payloadSize > 65000) {
      throw ConfigurationError(str(boost::format("Payload size %u is too large") % payloadSize));
   }
   PayloadSize = payloadSize;
}


// ###### Set UDP base port #################################################
void TraceConfiguration::setUDPBasePort(const unsigned int udpBasePort)
{
   if( (udpBasePort < 1) || (udpBasePort > 65535) ) {
      throw ConfigurationError(str(boost::format("Invalid UDP base port %u") % udpBasePort));
   }
   UDPBasePort = static_cast<uint16_t>(udpBasePort);
}


// ###### Set TCP port ######################################################
void TraceConfiguration::setTCPPort(const unsigned int tcpPort)
{
   if( (tcpPort < 1) || (tcpPort > 65535) ) {
      throw ConfigurationError(str(boost::format("Invalid TCP port %u") % tcpPort));
   }
   TCPPort = static_cast<uint16_t>(tcpPort);
}


// ###### Set traffic class #################################################
void TraceConfiguration::setTrafficClass(const unsigned int trafficClass)
{
   if(trafficClass > 255) {
      throw ConfigurationError(str(boost::format("Invalid traffic class %u") % trafficClass));
   }
   TrafficClass = static_cast<uint8_t>(trafficClass);
}


// ###### Set send interval #################################################
void TraceConfiguration::setSendInterval(const std::chrono::milliseconds& sendInterval)
{
   if(sendInterval.count() < 0) {
      throw ConfigurationError("Send interval must not be negative");
   }
   SendInterval = sendInterval;
}


// ###### Set maximum number of probes in flight ############################
void TraceConfiguration::setMaxInFlight(const unsigned int maxInFlight)
{
   if(maxInFlight < 1) {
      throw ConfigurationError("Maximum number of probes in flight must be at least 1");
   }
   MaxInFlight = maxInFlight;
}


// ###### Set cancellation grace period #####################################
void TraceConfiguration::setCancelGracePeriod(const std::chrono::milliseconds& cancelGracePeriod)
{
   if(cancelGracePeriod.count() < 0) {
      throw ConfigurationError("Cancellation grace period must not be negative");
   }
   CancelGracePeriod = cancelGracePeriod;
}


// ###### Check the combination of all settings #############################
void TraceConfiguration::validate() const
{
   if(Destination.is_unspecified()) {
      throw ConfigurationError("No destination address");
   }
   if(FirstTTL > MaxTTL) {
      throw ConfigurationError(str(boost::format("First TTL %u exceeds maximum TTL %u") % FirstTTL % MaxTTL));
   }
   if(PayloadSize < PacketCodec::minimumPayloadSize(Protocol)) {
      throw ConfigurationError(str(boost::format("Payload size %u is below the minimum of %u bytes for %s") %
                                      PayloadSize % PacketCodec::minimumPayloadSize(Protocol) %
                                      getProtocolName(Protocol)));
   }

   // ====== Check source address ===========================================
   if(Source.is_unspecified()) {
      // Checksums over a pseudo header need the source address. Only IPv4
      // ICMP and UDP can do without.
      if( (Destination.is_v6()) || (Protocol == PT_TCP) ) {
         throw ConfigurationError(str(boost::format("A source address is required for %s over %s") %
                                         getProtocolName(Protocol) % addressFamilyName(Destination)));
      }
   }
   else if(Source.is_v6() != Destination.is_v6()) {
      throw ConfigurationError(str(boost::format("%s source address %s for %s destination %s") %
                                      addressFamilyName(Source) % Source.to_string() %
                                      addressFamilyName(Destination) % Destination.to_string()));
   }

   // ====== Check identity space ===========================================
   const size_t width    = (size_t)(MaxTTL - FirstTTL + 1) * ProbesPerHop;
   const size_t capacity = IdentityScheme::capacity(Protocol, UDPBasePort);
   if(width > capacity) {
      throw ConfigurationError(str(boost::format("Trace width %u exceeds the %u probe identities available for %s") %
                                      width % capacity % getProtocolName(Protocol)));
   }
}


// ###### Read trace configuration ##########################################
void TraceConfiguration::readConfiguration(const std::filesystem::path& configurationFile)
{
   std::ifstream configurationInputStream(configurationFile);
   if(!configurationInputStream.good()) {
      throw ConfigurationError("Unable to read trace configuration from " + configurationFile.string());
   }

   std::string  destination;
   std::string  source       = (Source.is_unspecified()) ? std::string() : Source.to_string();
   std::string  protocolName = getProtocolName(Protocol);
   unsigned int firstTTL;
   unsigned int maxTTL;
   unsigned int probesPerHop;
   unsigned int probeTimeout;
   unsigned int traceDeadline;
   unsigned int payloadSize;
   unsigned int udpBasePort;
   unsigned int tcpPort;
   unsigned int trafficClass;
   unsigned int sendInterval;
   unsigned int maxInFlight;
   unsigned int cancelGracePeriod;

   boost::program_options::options_description optionsDescription("Options");
   optionsDescription.add_options()
      ("destination",         boost::program_options::value<std::string>(&destination),                                                      "destination address")
      ("source",              boost::program_options::value<std::string>(&source)->default_value(source),                                    "source address")
      ("protocol",            boost::program_options::value<std::string>(&protocolName)->default_value(protocolName),                        "protocol (icmp, udp, tcp)")
      ("first_ttl",           boost::program_options::value<unsigned int>(&firstTTL)->default_value(FirstTTL),                              "first TTL")
      ("max_ttl",             boost::program_options::value<unsigned int>(&maxTTL)->default_value(MaxTTL),                                   "maximum TTL")
      ("probes_per_hop",      boost::program_options::value<unsigned int>(&probesPerHop)->default_value(ProbesPerHop),                       "probes per hop")
      ("probe_timeout",       boost::program_options::value<unsigned int>(&probeTimeout)->default_value(ProbeTimeout.count()),               "probe timeout (ms)")
      ("trace_deadline",      boost::program_options::value<unsigned int>(&traceDeadline)->default_value(TraceDeadline.count()),             "trace deadline (ms)")
      ("payload_size",        boost::program_options::value<unsigned int>(&payloadSize)->default_value(PayloadSize),                         "payload size (bytes)")
      ("udp_base_port",       boost::program_options::value<unsigned int>(&udpBasePort)->default_value(UDPBasePort),                         "UDP base port")
      ("tcp_port",            boost::program_options::value<unsigned int>(&tcpPort)->default_value(TCPPort),                                 "TCP port")
      ("traffic_class",       boost::program_options::value<unsigned int>(&trafficClass)->default_value(TrafficClass),                       "traffic class")
      ("send_interval",       boost::program_options::value<unsigned int>(&sendInterval)->default_value(SendInterval.count()),               "send interval (ms)")
      ("max_in_flight",       boost::program_options::value<unsigned int>(&maxInFlight)->default_value(MaxInFlight),                         "maximum probes in flight")
      ("cancel_grace_period", boost::program_options::value<unsigned int>(&cancelGracePeriod)->default_value(CancelGracePeriod.count()),     "cancellation grace period (ms)");

   try {
      boost::program_options::variables_map vm = boost::program_options::variables_map();
      boost::program_options::store(boost::program_options::parse_config_file(configurationInputStream, optionsDescription), vm);
      boost::program_options::notify(vm);
   } catch(const boost::program_options::error& e) {
      throw ConfigurationError("Parsing configuration file " + configurationFile.string() +
                               " failed: " + e.what());
   }

   // ====== Check options ==================================================
   // Applied to a copy first, so that a rejected file changes nothing.
   TraceConfiguration configuration(*this);
   if(!destination.empty()) {
      configuration.setDestination(destination);
   }
   configuration.setSource(source);
   configuration.setProtocol(protocolName);
   configuration.setFirstTTL(firstTTL);
   configuration.setMaxTTL(maxTTL);
   configuration.setProbesPerHop(probesPerHop);
   configuration.setProbeTimeout(std::chrono::milliseconds(probeTimeout));
   configuration.setTraceDeadline(std::chrono::milliseconds(traceDeadline));
   configuration.setPayloadSize(payloadSize);
   configuration.setUDPBasePort(udpBasePort);
   configuration.setTCPPort(tcpPort);
   configuration.setTrafficClass(trafficClass);
   configuration.setSendInterval(std::chrono::milliseconds(sendInterval));
   configuration.setMaxInFlight(maxInFlight);
   configuration.setCancelGracePeriod(std::chrono::milliseconds(cancelGracePeriod));
   *this = configuration;

   RTRACE_LOG(debug) << "Read trace configuration from " << configurationFile
                     << ": " << *this;
}


// ###### Output operator ###################################################
std::ostream& operator<<(std::ostream& os, const TraceConfiguration& configuration)
{
   os << getProtocolName(configuration.Protocol) << " trace to " << configuration.Destination;
   if(!configuration.Source.is_unspecified()) {
      os << " from " << configuration.Source;
   }
   os << ": TTL "          << configuration.FirstTTL << ".." << configuration.MaxTTL
      << ", probes/hop "   << configuration.ProbesPerHop
      << ", timeout "      << durationToString<std::chrono::milliseconds>(configuration.ProbeTimeout)
      << ", deadline "     << durationToString<std::chrono::milliseconds>(configuration.TraceDeadline)
      << ", payload "      << configuration.PayloadSize << " B"
      << ", interval "     << durationToString<std::chrono::milliseconds>(configuration.SendInterval)
      << ", in flight "    << configuration.MaxInFlight
      << ", traffic class " << boost::format("0x%02x") % (unsigned int)configuration.TrafficClass;
   if(configuration.Protocol == PT_UDP) {
      os << ", base port " << configuration.UDPBasePort;
   }
   else if(configuration.Protocol == PT_TCP) {
      os << ", port " << configuration.TCPPort;
   }
   return os;
}
