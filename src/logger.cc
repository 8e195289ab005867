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

#include "logger.h"

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>


BOOST_LOG_GLOBAL_LOGGER_INIT(RTraceLogger, boost::log::sources::severity_logger_mt) {
   boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level> logger;

   // The engine runs the event loop and the receiver on different threads:
   logger.add_attribute("TimeStamp", boost::log::attributes::utc_clock());
   logger.add_attribute("ThreadID",  boost::log::attributes::current_thread_id());
   return logger;
}


// ###### Get ANSI colour sequence for a severity ###########################
static const char* severityColor(const boost::log::trivial::severity_level severity)
{
   switch(severity) {
      case boost::log::trivial::trace:
         return "\x1b[37m";
      case boost::log::trivial::debug:
         return "\x1b[36m";
      case boost::log::trivial::info:
         return "\x1b[34m";
      case boost::log::trivial::warning:
         return "\x1b[33m";
      case boost::log::trivial::error:
         return "\x1b[31;1m";
      default:
         return "\x1b[37;41;1m";
   }
}


// ###### Format a log record ###############################################
// [YYYY-MM-DD HH:MM:SS.ffffff][thread][severity]: message
template<bool Colored> static void formatRecord(const boost::log::record_view&  record,
                                                boost::log::formatting_ostream& os)
{
   const boost::log::value_ref<boost::log::trivial::severity_level> severity =
      boost::log::extract<boost::log::trivial::severity_level>("Severity", record);
   const boost::log::value_ref<boost::posix_time::ptime> timeStamp =
      boost::log::extract<boost::posix_time::ptime>("TimeStamp", record);
   const boost::log::value_ref<boost::log::attributes::current_thread_id::value_type> threadID =
      boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", record);

   if(Colored && severity) {
      os << severityColor(severity.get());
   }
   os << "[";
   if(timeStamp) {
      os << boost::posix_time::to_iso_extended_string(timeStamp.get()).replace(10, 1, " ");
   }
   os << "]";
   if(threadID) {
      os << "[" << threadID.get() << "]";
   }
   os << "[" << severity << "]: "
      << record[boost::log::expressions::smessage];
   if(Colored) {
      os << "\x1b[0m";
   }
}


// ###### Initialise logger #################################################
void initialiseLogger(const unsigned int logLevel,
                      const bool         logColor,
                      const char*        logFile)
{
   boost::shared_ptr<boost::log::core> core = boost::log::core::get();
   core->remove_all_sinks();

   const boost::log::formatter formatter =
      (logColor) ? boost::log::formatter(&formatRecord<true>) :
                   boost::log::formatter(&formatRecord<false>);
   const auto filter = boost::log::trivial::severity >= logLevel;

   // ====== Log file output ================================================
   if(logFile != nullptr) {
      typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend> FileSink;
      boost::shared_ptr<FileSink> fileSink = boost::make_shared<FileSink>(
         boost::log::keywords::file_name  = logFile,
         boost::log::keywords::open_mode  = std::ios_base::out | std::ios_base::app,
         boost::log::keywords::auto_flush = true);
      fileSink->set_formatter(formatter);
      fileSink->set_filter(filter);
      core->add_sink(fileSink);
   }

   // ====== Console output =================================================
   else {
      typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend> ConsoleSink;
      boost::shared_ptr<ConsoleSink> consoleSink = boost::make_shared<ConsoleSink>();
      consoleSink->locked_backend()->add_stream(
         boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      consoleSink->locked_backend()->auto_flush(true);
      consoleSink->set_formatter(formatter);
      consoleSink->set_filter(filter);
      core->add_sink(consoleSink);
   }

   RTRACE_LOG(trace) << "Initialised logger";
}
