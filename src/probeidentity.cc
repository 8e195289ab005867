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

#include "probeidentity.h"
#include "tools.h"
#include "traceexception.h"

#include <boost/format.hpp>
#include <boost/random/random_device.hpp>
#include <boost/random/uniform_int_distribution.hpp>


// ###### Create random session token #######################################
SessionToken SessionToken::random()
{
   boost::random::random_device                      randomDevice;
   boost::random::uniform_int_distribution<uint16_t> identifierDistribution(1024, 65535);
   boost::random::uniform_int_distribution<uint32_t> magicDistribution(1, 0xffffffff);
   // Identifiers below 1024 would be well-known UDP/TCP ports.
   const uint16_t identifier  = identifierDistribution(randomDevice);
   const uint32_t magicNumber = magicDistribution(randomDevice);
   return SessionToken(identifier, magicNumber);
}


// ###### Print session token ###############################################
std::ostream& operator<<(std::ostream& os, const SessionToken& sessionToken)
{
   os << boost::format("%04x/%08x") % sessionToken.Identifier % sessionToken.MagicNumber;
   return os;
}


// ###### Print probe identity ##############################################
std::ostream& operator<<(std::ostream& os, const ProbeIdentity& probeIdentity)
{
   os << probeIdentity.Identifier << ":" << probeIdentity.Ordinal;
   return os;
}


// ###### Constructor #######################################################
IdentityScheme::IdentityScheme(const ProtocolType  protocol,
                               const SessionToken& sessionToken,
                               const unsigned int  firstTTL,
                               const unsigned int  maxTTL,
                               const unsigned int  probesPerHop,
                               const uint16_t      udpBasePort)
   : Protocol(protocol),
     Token(sessionToken),
     FirstTTL(firstTTL),
     MaxTTL(maxTTL),
     ProbesPerHop(probesPerHop),
     UDPBasePort(udpBasePort)
{
   if( (FirstTTL < 1) || (FirstTTL > MaxTTL) || (ProbesPerHop < 1) ) {
      throw ConfigurationError(str(boost::format("Invalid TTL range %u..%u with %u probes per hop") %
                                      FirstTTL % MaxTTL % ProbesPerHop));
   }
   if(width() > capacity(Protocol, UDPBasePort)) {
      throw ConfigurationError(str(boost::format("Trace width %u exceeds the %u probe identities available for %s") %
                                      width() % capacity(Protocol, UDPBasePort) % getProtocolName(Protocol)));
   }
}


// ###### Get number of distinct ordinals ###################################
size_t IdentityScheme::capacity(const ProtocolType protocol,
                                const uint16_t     udpBasePort)
{
   if(protocol == PT_UDP) {
      return 65536 - (size_t)udpBasePort;
   }
   return 65536;
}


// ###### Make identity for a probe #########################################
ProbeIdentity IdentityScheme::makeIdentity(const unsigned int ttl,
                                           const unsigned int probeIndex) const
{
   assure((ttl >= FirstTTL) && (ttl <= MaxTTL));
   assure(probeIndex < ProbesPerHop);
   const unsigned int ordinal = (ttl - FirstTTL) * ProbesPerHop + probeIndex;
   return ProbeIdentity(Token.Identifier, static_cast<uint16_t>(ordinal));
}


// ###### Get TTL of a probe ################################################
unsigned int IdentityScheme::ttlOf(const ProbeIdentity& identity) const
{
   return FirstTTL + (identity.Ordinal / ProbesPerHop);
}


// ###### Get probe index of a probe ########################################
unsigned int IdentityScheme::probeIndexOf(const ProbeIdentity& identity) const
{
   return identity.Ordinal % ProbesPerHop;
}


// ###### Get the protocol fields carrying an identity ######################
ProbeFields IdentityScheme::toProbeFields(const ProbeIdentity&   identity,
                                          const SystemTimePoint& sendTime) const
{
   ProbeFields fields;
   fields.Identifier    = identity.Identifier;
   fields.MagicNumber   = Token.MagicNumber;
   fields.Ordinal       = identity.Ordinal;
   fields.ProbeIndex    = static_cast<uint8_t>(probeIndexOf(identity));
   fields.SendTimeStamp = usSinceEpoch(sendTime);
   switch(Protocol) {
      case PT_ICMP:
         fields.Marker = identity.Ordinal;
       break;
      case PT_UDP:
         fields.Marker = (uint32_t)UDPBasePort + identity.Ordinal;
       break;
      case PT_TCP:
         fields.Marker = (uint32_t)identity.Ordinal << 16;
       break;
   }
   return fields;
}


// ###### Extract identity from a response ##################################
bool IdentityScheme::extractIdentity(const ParsedPacket& parsedPacket,
                                     ProbeIdentity&      identity) const
{
   if(parsedPacket.Identifier != Token.Identifier) {
      return false;   // Another session
   }
   if( (parsedPacket.HasProbeHeader) &&
       (parsedPacket.MagicNumber != Token.MagicNumber) ) {
      return false;   // Another session, reusing the identifier
   }

   uint32_t ordinal;
   switch(Protocol) {
      case PT_UDP:
         if(parsedPacket.Marker < UDPBasePort) {
            return false;
         }
         ordinal = parsedPacket.Marker - UDPBasePort;
       break;
      case PT_TCP:
         // Acknowledgements may add the payload length to the lower bits.
         ordinal = parsedPacket.Marker >> 16;
       break;
      default:
         ordinal = parsedPacket.Marker & 0xffff;
       break;
   }
   if(ordinal >= width()) {
      return false;
   }

   identity = ProbeIdentity(parsedPacket.Identifier, static_cast<uint16_t>(ordinal));
   return true;
}
