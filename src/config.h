#ifndef CONFIG_H

#define CONFIG_H

#include <boost/log/trivial.hpp>
#include <chrono>
#include <filesystem>
#include <string>

#include "recording_session.h"

static const char default_catalog_url[] = "http://radio.garden/api/ara/content/";

struct recorder_config {
	std::string country;
	std::filesystem::path directory;
	std::string catalog_url = default_catalog_url;
	std::chrono::seconds duration {};
	size_t max_workers = default_max_workers;
	boost::log::trivial::severity_level log_level = boost::log::trivial::info;
};

// Parses "[-v] [-w workers] [-u catalog_url] <country> <directory> <duration_seconds>".
// Logs the offending argument and returns false on a usage error.
bool parse_arguments(int argc, const char * const argv[], recorder_config *config);
void print_usage(const char *program);

#endif // CONFIG_H
