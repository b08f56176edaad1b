#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <cstdlib>
#include <utility>
#include <vector>

#include "catalog.h"
#include "config.h"
#include "connection_pool.h"
#include "logging.h"
#include "recording_session.h"

int main(int argc, char *argv[])
{
	recorder_config config;

	if (!parse_arguments(argc, argv, &config)) {
		print_usage(*argv);
		return EXIT_FAILURE;
	}

	init_logging(config.log_level);

	boost::asio::io_context io;
	connection_pool pool {&io};
	catalog catalog {&io, &pool, config.catalog_url};
	std::vector<stream> streams;
	bool resolved = false;

	if (!catalog.resolve(
		config.country,
		[&streams, &resolved](std::vector<stream>&& s) {
			streams = std::move(s);
			resolved = true;
		},
		[] { BOOST_LOG_TRIVIAL(fatal) << "Failed to store streams."; }))
		return EXIT_FAILURE;

	io.run();

	if (!resolved)
		return EXIT_FAILURE;

	BOOST_LOG_TRIVIAL(info) << "Stored " << streams.size() << " streams.";

	const recording_options options {config.directory, config.duration, config.max_workers};

	if (!record_streams(streams, options))
		return EXIT_FAILURE;

	BOOST_LOG_TRIVIAL(info) << "Successfully recorded streams.";
	return EXIT_SUCCESS;
}
