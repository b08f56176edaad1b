#ifndef CATALOG_H

#define CATALOG_H

#include <boost/asio.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "connection_pool.h"
#include "stream.h"

namespace asio = boost::asio;

struct channel_page {
	std::string title;
	std::string url;
};

// Resolves a country into the streams of every channel that the Radio Garden catalog
// lists for the places in that country. Places are fetched first, then the channels of
// each place one request at a time. The first failure aborts the whole resolution.
class catalog {
	public:
		typedef std::function<void(std::vector<stream>&&)> on_complete_callback;
		typedef std::function<void(void)> on_error_callback;

	private:
		std::vector<std::string> place_ids;
		std::vector<stream> streams;
		std::unordered_map<std::string, size_t> name_counts;
		std::string base_url;
		std::string country;
		std::string_view host;
		std::string_view resource;
		on_complete_callback on_complete;
		on_error_callback on_error;
		asio::io_context * const io = nullptr;
		connection_pool * const pool = nullptr;
		size_t next_place = 0;
		bool is_https = false;

		void add_stream(const channel_page& page);
		void fail();
		void fetch_next_channels();
		void on_channels_receive(http_response *response);
		void on_places_receive(http_response *response);

	public:
		catalog(asio::io_context *io, connection_pool *p, const std::string& url) :
		    base_url(url), io(io), pool(p)
		{
		}

		catalog(const catalog&) = delete;
		catalog& operator=(const catalog&) = delete;

		// Returns false if the base URL is invalid. Otherwise exactly one of the callbacks
		// is invoked once the I/O context runs.
		bool resolve(const std::string& c,
			     on_complete_callback&& on_complete_fn,
			     on_error_callback&& on_error_fn);

		std::string stream_url(const std::string_view& page_url) const;

		static bool parse_channels(const std::vector<char>& body,
					   std::vector<channel_page> *pages);
		static bool parse_places(const std::vector<char>& body,
					 const std::string& country,
					 std::vector<std::string> *ids);
};

#endif // CATALOG_H
