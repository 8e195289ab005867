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

#ifndef PROBEIDENTITY_H
#define PROBEIDENTITY_H

#include <stdint.h>

#include <ostream>

#include "packetcodec.h"
#include "tools.h"


// ###### Session token #####################################################
// Separates concurrent traces sharing one raw socket. The identifier is the
// ICMP identifier or the UDP/TCP source port, the magic number is written
// into the probe header.
struct SessionToken
{
   SessionToken(const uint16_t identifier  = 0,
                const uint32_t magicNumber = 0)
      : Identifier(identifier),
        MagicNumber(magicNumber) { }

   static SessionToken random();

   uint16_t Identifier;
   uint32_t MagicNumber;
};

std::ostream& operator<<(std::ostream& os, const SessionToken& sessionToken);


// ###### Probe identity ####################################################
struct ProbeIdentity
{
   ProbeIdentity(const uint16_t identifier = 0,
                 const uint16_t ordinal    = 0)
      : Identifier(identifier),
        Ordinal(ordinal) { }

   inline bool operator==(const ProbeIdentity& other) const {
      return( (Identifier == other.Identifier) && (Ordinal == other.Ordinal) );
   }
   inline bool operator!=(const ProbeIdentity& other) const {
      return(!(*this == other));
   }

   uint16_t Identifier;
   uint16_t Ordinal;      // (TTL - FirstTTL) * ProbesPerHop + probe index
};

std::ostream& operator<<(std::ostream& os, const ProbeIdentity& probeIdentity);


// ###### Identity scheme ###################################################
// Every probe of a session gets its own ordinal; ordinals are never reused.
// The number of ordinals is limited by the field carrying them:
// - ICMP: 16-bit sequence number
// - UDP:  destination port UDPBasePort + ordinal (at most 65535)
// - TCP:  upper 16 bits of the sequence number
class IdentityScheme
{
   public:
   IdentityScheme(const ProtocolType  protocol,
                  const SessionToken& sessionToken,
                  const unsigned int  firstTTL,
                  const unsigned int  maxTTL,
                  const unsigned int  probesPerHop,
                  const uint16_t      udpBasePort = 33434);

   static size_t capacity(const ProtocolType protocol,
                          const uint16_t     udpBasePort);

   inline size_t width() const {
      return (size_t)(MaxTTL - FirstTTL + 1) * ProbesPerHop;
   }
   inline ProtocolType protocol() const {
      return Protocol;
   }
   inline const SessionToken& sessionToken() const {
      return Token;
   }

   ProbeIdentity makeIdentity(const unsigned int ttl,
                              const unsigned int probeIndex) const;
   unsigned int ttlOf(const ProbeIdentity& identity) const;
   unsigned int probeIndexOf(const ProbeIdentity& identity) const;
   ProbeFields toProbeFields(const ProbeIdentity&   identity,
                             const SystemTimePoint& sendTime) const;
   bool extractIdentity(const ParsedPacket& parsedPacket,
                        ProbeIdentity&      identity) const;

   private:
   const ProtocolType Protocol;
   const SessionToken Token;
   const unsigned int FirstTTL;
   const unsigned int MaxTTL;
   const unsigned int ProbesPerHop;
   const uint16_t     UDPBasePort;
};

#endif
