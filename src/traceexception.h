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

#ifndef TRACEEXCEPTION_H
#define TRACEEXCEPTION_H

#include <stdexcept>
#include <string>

#include <boost/system/error_code.hpp>


// Base class for all route tracing problems
class TraceException : public std::runtime_error
{
   public:
   TraceException(const std::string& error) : std::runtime_error(error) { }
};


// Invalid trace configuration => the trace never starts
class ConfigurationError : public TraceException
{
   public:
   ConfigurationError(const std::string& error) : TraceException(error) { }
};


// A probe packet cannot be built
class EncodingError : public TraceException
{
   public:
   EncodingError(const std::string& error) : TraceException(error) { }
};


// The transport cannot transmit => the running trace is aborted
class SendError : public TraceException
{
   public:
   SendError(const std::string&               error,
             const boost::system::error_code& errorCode)
      : TraceException(error + ": " + errorCode.message()),
        ErrorCode(errorCode) { }

   inline const boost::system::error_code& errorCode() const { return ErrorCode; }

   private:
   const boost::system::error_code ErrorCode;
};

#endif
