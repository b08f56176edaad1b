#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/log/trivial.hpp>
#include <cctype>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog.h"

using json = nlohmann::json;

#define CHANNELS_RESOURCE "/channels"
#define LISTEN_RESOURCE "listen/"
#define PAGE_RESOURCE "page/"
#define PLACES_RESOURCE "places"
#define STREAM_RESOURCE "/channel.mp3"

static const char name_suffix_delimiter = '_';

static std::string alphanumeric(const std::string_view& title)
{
	std::string ret;

	for (const char c : title)
		if (std::isalnum(static_cast<unsigned char>(c)))
			ret.push_back(c);

	return ret;
}

static bool check_response(http_response *response, const std::string_view& what)
{
	if (response->result() == http::status::ok)
		return true;

	BOOST_LOG_TRIVIAL(error) << "Invalid " << response->result_int() << " response for "
				 << what;
	return false;
}

bool catalog::parse_channels(const std::vector<char>& body, std::vector<channel_page> *pages)
{
	bool ret = false;

	try {
		const auto document = json::parse(body.begin(), body.end());

		for (const auto& content : document.at("data").at("content")) {
			if (!content.contains("items"))
				continue;

			for (const auto& item : content.at("items")) {
				const auto& page = item.at("page");

				pages->push_back(channel_page {page.at("title").get<std::string>(),
							       page.at("url").get<std::string>()});
			}
		}

		ret = true;
	}
	catch (const json::exception& e) {
		BOOST_LOG_TRIVIAL(error) << "Malformed channel list: " << e.what();
	}

	return ret;
}

bool catalog::parse_places(const std::vector<char>& body,
			   const std::string& country,
			   std::vector<std::string> *ids)
{
	bool ret = false;

	try {
		const auto document = json::parse(body.begin(), body.end());

		for (const auto& place : document.at("data").at("list"))
			if (place.at("country").get<std::string>() == country)
				ids->push_back(place.at("id").get<std::string>());

		ret = true;
	}
	catch (const json::exception& e) {
		BOOST_LOG_TRIVIAL(error) << "Malformed place list: " << e.what();
	}

	return ret;
}

void catalog::add_stream(const channel_page& page)
{
	// The channel ID is the last element of the page path.
	const std::string_view page_url {page.url};
	const auto id = page_url.substr(page_url.rfind(resource_delimiter) + 1);

	if (id.empty()) {
		BOOST_LOG_TRIVIAL(warning) << "Skipping channel without an ID: " << page.title;
		return;
	}

	// Distinct titles can sanitize to the same file name.
	std::string name {sanitize_name(alphanumeric(page.title))};
	const size_t count = ++name_counts[name];

	if (count > 1) {
		name.push_back(name_suffix_delimiter);
		name.append(std::to_string(count));
	}

	streams.push_back(stream {std::move(name), stream_url(page_url)});
}

void catalog::fail()
{
	place_ids.clear();
	streams.clear();

	if (on_error)
		on_error();
}

void catalog::fetch_next_channels()
{
	if (next_place == place_ids.size()) {
		BOOST_LOG_TRIVIAL(info) << "Found " << streams.size() << " streams in " << country;
		on_complete(std::move(streams));
		return;
	}

	std::string r {resource};

	r.append(PAGE_RESOURCE);
	r.append(place_ids[next_place]);
	r.append(CHANNELS_RESOURCE);
	BOOST_LOG_TRIVIAL(info) << "Fetching channels from URL: "
				<< (is_https ? HTTPS_PREFIX : HTTP_PREFIX) << host << r;
	pool->get(is_https,
		  host,
		  r,
		  std::bind(&catalog::on_channels_receive, this, std::placeholders::_1),
		  std::bind(&catalog::fail, this));
}

void catalog::on_channels_receive(http_response *response)
{
	std::vector<channel_page> pages;

	if (!check_response(response, place_ids[next_place]) ||
	    !parse_channels(response->body(), &pages)) {
		fail();
		return;
	}

	for (const auto& page : pages)
		add_stream(page);

	next_place++;
	// Let the pool take the connection back before it is asked for the next one.
	asio::post(*io, std::bind(&catalog::fetch_next_channels, this));
}

void catalog::on_places_receive(http_response *response)
{
	if (!check_response(response, PLACES_RESOURCE) ||
	    !parse_places(response->body(), country, &place_ids)) {
		fail();
		return;
	}

	BOOST_LOG_TRIVIAL(trace) << "Found " << place_ids.size() << " places in " << country;
	asio::post(*io, std::bind(&catalog::fetch_next_channels, this));
}

bool catalog::resolve(const std::string& c,
		      on_complete_callback&& on_complete_fn,
		      on_error_callback&& on_error_fn)
{
	bool ret = false;

	if (connection_pool::parse_url(base_url, &is_https, &host, &resource) &&
	    resource.back() == resource_delimiter) {
		std::string r {resource};

		country = c;
		on_complete = std::move(on_complete_fn);
		on_error = std::move(on_error_fn);
		place_ids.clear();
		streams.clear();
		name_counts.clear();
		next_place = 0;
		r.append(PLACES_RESOURCE);
		BOOST_LOG_TRIVIAL(info) << "Fetching places from URL: " << base_url << PLACES_RESOURCE;
		pool->get(is_https,
			  host,
			  r,
			  std::bind(&catalog::on_places_receive, this, std::placeholders::_1),
			  std::bind(&catalog::fail, this));
		ret = true;
	}
	else
		BOOST_LOG_TRIVIAL(error) << "Invalid catalog URL: " << base_url;

	return ret;
}

std::string catalog::stream_url(const std::string_view& page_url) const
{
	std::string ret {base_url};

	ret.append(LISTEN_RESOURCE);
	ret.append(page_url.substr(page_url.rfind(resource_delimiter) + 1));
	ret.append(STREAM_RESOURCE);
	return ret;
}
