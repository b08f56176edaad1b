#ifndef STREAM_RECORDER_H

#define STREAM_RECORDER_H

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "stream.h"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = asio::ssl;
using tcp = boost::asio::ip::tcp;

class connection;

enum class recording_error { none, network, io, decode };

const char *to_string(recording_error error) noexcept;

struct recording_outcome {
	std::string name;
	std::filesystem::path path;
	recording_error error = recording_error::none;
	std::string message;
	std::uint64_t bytes = 0;
	size_t chunks = 0;
	std::chrono::steady_clock::duration elapsed {};
};

typedef std::function<void(const recording_outcome&)> outcome_callback;

std::filesystem::path recording_path(const std::filesystem::path& directory,
				     const std::string_view& name);

// Copies one stream into "stream_<name>.mp3" until the deadline passes or the stream
// ends. The deadline is checked between chunk reads only, so a recording can overrun it
// by the time it takes to receive one chunk. record() runs an I/O context of its own on
// the calling thread and never throws.
class stream_recorder {
		std::vector<char> chunk;
		std::chrono::steady_clock::time_point start;
		stream source;
		recording_outcome outcome;
		beast::file output;
		std::chrono::steady_clock::duration deadline;
		asio::io_context io;
		tcp::resolver resolver;
		std::shared_ptr<connection> current;
		std::string url;
		ssl::context * const tls_context = nullptr;
		outcome_callback on_outcome;
		size_t redirects = 0;
		bool finished = false;
		bool recording = false;

		void finish(recording_error error, const std::string& message);
		void on_chunk(size_t size, bool done);
		void on_header(const http::response_header<>& header);
		void on_network_error();
		bool open(const std::string& u);
		std::string resolve_location(const std::string_view& location) const;
		void read_next_chunk();

	public:
		stream_recorder(const stream& s,
				std::chrono::steady_clock::duration deadline,
				const std::filesystem::path& directory,
				ssl::context *tls_context,
				outcome_callback on_outcome = {});
		stream_recorder(const stream_recorder&) = delete;
		stream_recorder& operator=(const stream_recorder&) = delete;

		recording_outcome record();
};

#endif // STREAM_RECORDER_H
