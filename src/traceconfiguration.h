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

#ifndef TRACECONFIGURATION_H
#define TRACECONFIGURATION_H

#include <stdint.h>

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>

#include <boost/asio/ip/address.hpp>

#include "packetcodec.h"


// ###### Configuration of a single trace ###################################
// Every setter checks its value and throws ConfigurationError if it is
// invalid. validate() checks the combination of all values.
class TraceConfiguration
{
   public:
   TraceConfiguration();
   ~TraceConfiguration();

   inline const boost::asio::ip::address& getDestination()  const { return Destination;       }
   inline const boost::asio::ip::address& getSource()       const { return Source;            }
   inline ProtocolType                    getProtocol()     const { return Protocol;          }
   inline unsigned int                    getFirstTTL()     const { return FirstTTL;          }
   inline unsigned int                    getMaxTTL()       const { return MaxTTL;            }
   inline unsigned int                    getProbesPerHop() const { return ProbesPerHop;      }
   inline std::chrono::milliseconds       getProbeTimeout() const { return ProbeTimeout;      }
   inline std::chrono::milliseconds       getTraceDeadline() const { return TraceDeadline;    }
   inline size_t                          getPayloadSize()  const { return PayloadSize;       }
   inline uint16_t                        getUDPBasePort()  const { return UDPBasePort;       }
   inline uint16_t                        getTCPPort()      const { return TCPPort;           }
   inline uint8_t                         getTrafficClass() const { return TrafficClass;      }
   inline std::chrono::milliseconds       getSendInterval() const { return SendInterval;      }
   inline unsigned int                    getMaxInFlight()  const { return MaxInFlight;       }
   inline std::chrono::milliseconds       getCancelGracePeriod() const { return CancelGracePeriod; }

   void setDestination(const boost::asio::ip::address& destination);
   void setDestination(const std::string& destination);
   void setSource(const boost::asio::ip::address& source);
   void setSource(const std::string& source);
   void setProtocol(const ProtocolType protocol);
   void setProtocol(const std::string& protocolName);
   void setFirstTTL(const unsigned int firstTTL);
   void setMaxTTL(const unsigned int maxTTL);
   void setProbesPerHop(const unsigned int probesPerHop);
   void setProbeTimeout(const std::chrono::milliseconds& probeTimeout);
   void setTraceDeadline(const std::chrono::milliseconds& traceDeadline);
   void setPayloadSize(const size_t payloadSize);
   void setUDPBasePort(const unsigned int udpBasePort);
   void setTCPPort(const unsigned int tcpPort);
   void setTrafficClass(const unsigned int trafficClass);
   void setSendInterval(const std::chrono::milliseconds& sendInterval);
   void setMaxInFlight(const unsigned int maxInFlight);
   void setCancelGracePeriod(const std::chrono::milliseconds& cancelGracePeriod);

   void validate() const;
   void readConfiguration(const std::filesystem::path& configurationFile);

   friend std::ostream& operator<<(std::ostream& os, const TraceConfiguration& configuration);

   private:
   boost::asio::ip::address  Destination;
   boost::asio::ip::address  Source;
   ProtocolType              Protocol;
   unsigned int              FirstTTL;
   unsigned int              MaxTTL;
   unsigned int              ProbesPerHop;
   std::chrono::milliseconds ProbeTimeout;
   std::chrono::milliseconds TraceDeadline;
   size_t                    PayloadSize;
   uint16_t                  UDPBasePort;
   uint16_t                  TCPPort;
   uint8_t                   TrafficClass;
   std::chrono::milliseconds SendInterval;
   unsigned int              MaxInFlight;
   std::chrono::milliseconds CancelGracePeriod;
};

#endif
