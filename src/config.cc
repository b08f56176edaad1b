#include <boost/log/trivial.hpp>
#include <charconv>
#include <chrono>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "config.h"
#include "connection_pool.h"

#define CATALOG_URL_OPTION "-u"
#define END_OF_OPTIONS "--"
#define VERBOSE_OPTION "-v"
#define WORKERS_OPTION "-w"

static const size_t num_positional_arguments = 3;
// Recording deadlines are kept as steady_clock durations.
static const std::chrono::seconds::rep max_duration =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max())
        .count();
static const char option_prefix = '-';

template<typename T> static bool parse_number(const std::string_view& s, T *value)
{
	const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), *value);

	return ec == std::errc {} && end == s.data() + s.size();
}

bool parse_arguments(int argc, const char * const argv[], recorder_config *config)
{
	std::vector<std::string_view> positional;
	bool options_done = false;

	for (int i = 1; i < argc; i++) {
		const std::string_view arg {argv[i]};

		if (options_done || arg.size() < 2 || arg.front() != option_prefix)
			positional.push_back(arg);
		else if (arg == END_OF_OPTIONS)
			options_done = true;
		else if (arg == VERBOSE_OPTION)
			config->log_level = boost::log::trivial::trace;
		else if (arg == WORKERS_OPTION || arg == CATALOG_URL_OPTION) {
			if (++i == argc) {
				BOOST_LOG_TRIVIAL(error) << "Missing value for option: " << arg;
				return false;
			}

			const std::string_view value {argv[i]};

			if (arg == CATALOG_URL_OPTION) {
				bool is_https;
				std::string_view host;
				std::string_view resource;

				if (!connection_pool::parse_url(value, &is_https, &host, &resource) ||
				    resource.back() != resource_delimiter) {
					BOOST_LOG_TRIVIAL(error) << "Invalid catalog URL: " << value;
					return false;
				}

				config->catalog_url = value;
			}
			else if (!parse_number(value, &config->max_workers) || !config->max_workers) {
				BOOST_LOG_TRIVIAL(error) << "Invalid number of workers: " << value;
				return false;
			}
		}
		else {
			BOOST_LOG_TRIVIAL(error) << "Unknown option: " << arg;
			return false;
		}
	}

	if (positional.size() != num_positional_arguments) {
		BOOST_LOG_TRIVIAL(error) << "Expected " << num_positional_arguments
					 << " arguments, got " << positional.size();
		return false;
	}

	std::chrono::seconds::rep duration = 0;

	if (!parse_number(positional[2], &duration) || duration < 0 || duration > max_duration) {
		BOOST_LOG_TRIVIAL(error) << "Invalid duration: " << positional[2];
		return false;
	}

	config->country = positional[0];
	config->directory = positional[1];
	config->duration = std::chrono::seconds {duration};
	return true;
}

void print_usage(const char *program)
{
	BOOST_LOG_TRIVIAL(info) << "Usage: " << program << " [" VERBOSE_OPTION "] [" WORKERS_OPTION
				<< " workers] [" CATALOG_URL_OPTION
				<< " catalog_url] <country> <directory> <duration_seconds>";
}
