#ifndef LOGGING_H

#define LOGGING_H

#include <boost/log/trivial.hpp>

// Sends log records at or above the given severity to std::clog, tagged with a time stamp
// and the ID of the thread that emitted them.
void init_logging(boost::log::trivial::severity_level severity);

#endif // LOGGING_H
