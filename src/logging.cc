#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <iostream>

#include "logging.h"

namespace logging = boost::log;
namespace expr = boost::log::expressions;

void init_logging(logging::trivial::severity_level severity)
{
	logging::add_common_attributes();
	logging::add_console_log(
	    std::clog,
	    logging::keywords::format =
		(expr::stream << '['
			      << expr::format_date_time<boost::posix_time::ptime>(
				     "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
			      << "] ["
			      << expr::attr<logging::attributes::current_thread_id::value_type>(
				     "ThreadID")
			      << "] [" << logging::trivial::severity << "] " << expr::smessage));
	logging::core::get()->set_filter(logging::trivial::severity >= severity);
}
