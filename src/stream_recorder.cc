#include <boost/beast.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "connection.h"
#include "connection_pool.h"
#include "stream_recorder.h"

static const size_t chunk_size = 16 * 1024;
static const std::string file_extension = ".mp3";
static const std::string file_prefix = "stream_";
static const size_t max_redirects = 10;
static const char scheme_relative_prefix[] = "//";

const char *to_string(recording_error error) noexcept
{
	switch (error) {
	case recording_error::none:
		return "none";
	case recording_error::network:
		return "network error";
	case recording_error::io:
		return "I/O error";
	case recording_error::decode:
		return "decode error";
	}

	return "unknown error";
}

std::filesystem::path recording_path(const std::filesystem::path& directory,
				     const std::string_view& name)
{
	return directory / (file_prefix + sanitize_name(name) + file_extension);
}

stream_recorder::stream_recorder(const stream& s,
				 std::chrono::steady_clock::duration deadline,
				 const std::filesystem::path& directory,
				 ssl::context *tls_context,
				 outcome_callback on_outcome) :
    chunk(chunk_size), source(s), deadline(deadline), resolver(io),
    tls_context(tls_context), on_outcome(std::move(on_outcome))
{
	outcome.name = source.name;
	outcome.path = recording_path(directory, source.name);
}

void stream_recorder::finish(recording_error error, const std::string& message)
{
	if (finished)
		return;

	finished = true;
	outcome.error = error;
	outcome.message = message;

	if (recording) {
		beast::error_code ec;

		outcome.elapsed = std::chrono::steady_clock::now() - start;
		output.close(ec);

		if (ec && error == recording_error::none) {
			outcome.error = recording_error::io;
			outcome.message = "Error closing file: " + ec.message();
		}
	}

	current.reset();

	const auto seconds = std::chrono::duration<double>(outcome.elapsed).count();

	if (outcome.error == recording_error::none)
		BOOST_LOG_TRIVIAL(info) << "Successfully recorded: " << outcome.path.string() << " ("
					<< outcome.bytes << " bytes in " << outcome.chunks
					<< " chunks, " << seconds << " s, " << outcome.message << ")";
	else
		BOOST_LOG_TRIVIAL(error) << "Failed to record " << source.name << ": "
					 << to_string(outcome.error) << ": " << outcome.message;

	if (on_outcome)
		on_outcome(outcome);
}

void stream_recorder::on_chunk(size_t size, bool done)
{
	if (size) {
		beast::error_code ec;

		output.write(chunk.data(), size, ec);

		if (ec) {
			finish(recording_error::io, "Error writing to file: " + ec.message());
			return;
		}

		outcome.bytes += size;
		outcome.chunks++;
		BOOST_LOG_TRIVIAL(trace) << "Wrote chunk " << outcome.chunks << " of " << source.name
					 << ": size = " << size;
	}

	if (done)
		finish(recording_error::none, "end of stream");
	else
		read_next_chunk();
}

void stream_recorder::on_header(const http::response_header<>& header)
{
	const auto status_class = http::to_status_class(header.result());

	if (status_class == http::status_class::redirection) {
		const auto field = header[http::field::location];
		const std::string_view location {field.data(), field.size()};

		if (location.empty())
			finish(recording_error::network,
			       "Redirect without a location: " + std::to_string(header.result_int()));
		else if (++redirects > max_redirects)
			finish(recording_error::network, "Too many redirects: " + url);
		else {
			const std::string target {resolve_location(location)};

			BOOST_LOG_TRIVIAL(trace) << "Redirected from " << url << " to " << target;
			open(target);
		}
	}
	else if (status_class != http::status_class::successful)
		finish(recording_error::network,
		       "Invalid " + std::to_string(header.result_int()) + " response: " + url);
	else {
		beast::error_code ec;

		output.open(outcome.path.c_str(), beast::file_mode::write, ec);

		if (ec)
			finish(recording_error::io,
			       "Error creating file " + outcome.path.string() + ": " + ec.message());
		else {
			recording = true;
			start = std::chrono::steady_clock::now();
			read_next_chunk();
		}
	}
}

void stream_recorder::on_network_error()
{
	const auto& ec = current->get_last_error();

	// The partial recording is kept.
	if (recording)
		finish(recording_error::network, "Error reading from response: " + ec.message());
	else
		finish(recording_error::network,
		       "Error fetching stream URL " + url + ": " + ec.message());
}

bool stream_recorder::open(const std::string& u)
{
	std::string_view host;
	std::string_view resource;
	bool is_https;

	url = u;

	if (!connection_pool::parse_url(url, &is_https, &host, &resource)) {
		finish(recording_error::network, "Invalid URL: " + url);
		return false;
	}

	current = make_connection(is_https, redirects, host, &io, &resolver, tls_context);
	current->open_stream(
	    resource,
	    std::bind(&stream_recorder::on_header, this, std::placeholders::_1),
	    [this](const std::string&) { on_network_error(); });
	return true;
}

void stream_recorder::read_next_chunk()
{
	if (std::chrono::steady_clock::now() - start >= deadline) {
		finish(recording_error::none, "deadline reached");
		return;
	}

	current->read_chunk(chunk.data(),
			    chunk.size(),
			    std::bind(&stream_recorder::on_chunk,
				      this,
				      std::placeholders::_1,
				      std::placeholders::_2));
}

recording_outcome stream_recorder::record()
{
	BOOST_LOG_TRIVIAL(trace) << "Recording " << source.url << " to " << outcome.path.string();

	try {
		if (open(source.url))
			io.run();

		if (!finished)
			finish(recording_error::network, "Connection closed: " + url);
	}
	catch (const std::exception& e) {
		finish(recording_error::network, e.what());
	}

	return outcome;
}

std::string stream_recorder::resolve_location(const std::string_view& location) const
{
	if (location.rfind(HTTP_PREFIX, 0) == 0 || location.rfind(HTTPS_PREFIX, 0) == 0)
		return std::string {location};

	std::string ret {url};
	const auto host_pos = url.find(PROTOCOL_END) + sizeof(PROTOCOL_END) - 1;

	if (location.rfind(scheme_relative_prefix, 0) == 0)
		ret.resize(host_pos - (sizeof(scheme_relative_prefix) - 1));
	else if (location.front() == resource_delimiter)
		ret.resize(url.find(resource_delimiter, host_pos));
	else
		ret.resize(url.rfind(resource_delimiter, url.find('?')) + 1);

	ret.append(location);
	return ret;
}
