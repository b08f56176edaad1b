#include <algorithm>
#include <boost/asio/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <exception>
#include <filesystem>
#include <system_error>
#include <vector>

#include "connection_pool.h"
#include "recording_session.h"
#include "thread_pool.h"

size_t worker_count(size_t max_workers, size_t num_streams) noexcept
{
	return std::min(max_workers, num_streams);
}

bool record_streams(const std::vector<stream>& streams,
		    const recording_options& options,
		    const outcome_callback& on_outcome)
{
	std::error_code ec;

	std::filesystem::create_directories(options.directory, ec);

	if (ec) {
		BOOST_LOG_TRIVIAL(fatal) << "Failed to create output directory "
					 << options.directory.string() << ": " << ec.message();
		return false;
	}

	if (streams.empty()) {
		BOOST_LOG_TRIVIAL(warning) << "No streams to record.";
		return true;
	}

	// Shared by every recording; it is only read once configured.
	ssl::context tls_context {ssl::context::tlsv12_client};

	configure_tls_context(&tls_context);

	thread_pool pool {worker_count(options.max_workers, streams.size())};

	BOOST_LOG_TRIVIAL(info) << "Recording " << streams.size() << " streams with "
				<< pool.size() << " workers for "
				<< std::chrono::duration<double>(options.duration).count() << " s.";

	for (const auto& s : streams)
		pool.execute([s, &options, &on_outcome, &tls_context]() {
			try {
				stream_recorder recorder {
				    s, options.duration, options.directory, &tls_context, on_outcome};

				recorder.record();
			}
			catch (const std::exception& e) {
				BOOST_LOG_TRIVIAL(error) << "Failed to start recording " << s.name << ": "
							 << e.what();
			}
		});

	pool.terminate();
	pool.shutdown();
	return true;
}
