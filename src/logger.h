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

#ifndef LOGGER_H
#define LOGGER_H

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/global_logger_storage.hpp>


BOOST_LOG_GLOBAL_LOGGER(RTraceLogger, boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>)

#define RTRACE_LOG(_severity_) BOOST_LOG_SEV(RTraceLogger::get(), boost::log::trivial::_severity_)


// Installs a console sink on std::clog, or a file sink if logFile is set.
// Calling it again replaces the previous sink.
void initialiseLogger(const unsigned int logLevel = boost::log::trivial::severity_level::info,
                      const bool         logColor = true,
                      const char*        logFile  = nullptr);

#endif
