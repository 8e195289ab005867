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

#include "tools.h"
#include "logger.h"

#include <stdlib.h>
#include <iostream>


// ###### Report a failed invariant and terminate ###########################
void rtraceAssureFail(const char*        expression,
                      const char*        file,
                      const unsigned int line,
                      const char*        function)
{
   const std::string message =
      (boost::format("Invariant \"%s\" violated in %s() at %s:%u") %
          expression % function % file % line).str();
   RTRACE_LOG(fatal) << message;
   std::cerr << message << "\n";
   abort();
}


// ###### Drop the IPv6 scope ID of an address ##############################
// Link-local responders report their scope; comparisons ignore it.
boost::asio::ip::address dropScopeID(const boost::asio::ip::address& address)
{
   if(address.is_v6()) {
      boost::asio::ip::address_v6 v6 = address.to_v6();
      v6.scope_id(0);
      return boost::asio::ip::address(v6);
   }
   return address;
}


// ###### Get address family name ###########################################
const char* addressFamilyName(const boost::asio::ip::address& address)
{
   return (address.is_v6()) ? "IPv6" : "IPv4";
}
