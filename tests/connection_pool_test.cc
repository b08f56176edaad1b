#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <string>
#include <string_view>

#include "connection.h"
#include "connection_pool.h"
#include "test_http_server.h"

TEST(ConnectionPoolTest, ParsesHttpAndHttpsUrls)
{
	bool is_https = true;
	std::string_view host;
	std::string_view resource;

	ASSERT_TRUE(connection_pool::parse_url(
	    "http://radio.garden/api/ara/content/places", &is_https, &host, &resource));
	EXPECT_FALSE(is_https);
	EXPECT_EQ(host, "radio.garden");
	EXPECT_EQ(resource, "/api/ara/content/places");

	ASSERT_TRUE(connection_pool::parse_url(
	    "https://stream.example.com:8443/live?token=1", &is_https, &host, &resource));
	EXPECT_TRUE(is_https);
	EXPECT_EQ(host, "stream.example.com:8443");
	EXPECT_EQ(resource, "/live?token=1");
}

TEST(ConnectionPoolTest, RejectsInvalidUrls)
{
	bool is_https;
	std::string_view host;
	std::string_view resource;

	EXPECT_FALSE(connection_pool::parse_url("radio.garden/places", &is_https, &host, &resource));
	EXPECT_FALSE(connection_pool::parse_url("ftp://radio.garden/", &is_https, &host, &resource));
	EXPECT_FALSE(connection_pool::parse_url("http://radio.garden", &is_https, &host, &resource));
	EXPECT_FALSE(connection_pool::parse_url("http:///places", &is_https, &host, &resource));
}

TEST(ConnectionPoolTest, AppendsTheDefaultPort)
{
	EXPECT_EQ(host_with_port(false, "radio.garden"), "radio.garden:80");
	EXPECT_EQ(host_with_port(true, "radio.garden"), "radio.garden:443");
	EXPECT_EQ(host_with_port(true, "radio.garden:8443"), "radio.garden:8443");
}

TEST(ConnectionPoolTest, QueuesRequestsBeyondTheConnectionLimit)
{
	test_http_server server {[](test_http_server&, tcp::socket& socket, const auto& request) {
		const std::string target {request.target().data(), request.target().size()};

		respond(socket, http::status::ok, target, "text/plain");
	}};
	boost::asio::io_context io;
	connection_pool pool {&io};
	size_t received = 0;
	size_t failed = 0;

	for (size_t i = 0; i < 10; i++) {
		const std::string resource {"/item/" + std::to_string(i)};

		ASSERT_TRUE(pool.get(
		    server.url(resource),
		    [&received, resource](http_response *response) {
			    EXPECT_EQ(std::string(response->body().begin(), response->body().end()),
				      resource);
			    received++;
		    },
		    [&failed] { failed++; }));
	}

	io.run();

	EXPECT_EQ(received, 10u);
	EXPECT_EQ(failed, 0u);
	EXPECT_EQ(server.requests(), 10u);
}

TEST(ConnectionPoolTest, ReportsUnreachableHosts)
{
	boost::asio::io_context io;
	connection_pool pool {&io};
	bool failed = false;

	ASSERT_TRUE(pool.get(
	    refused_url("/"), [](http_response *) { FAIL() << "unexpected response"; }, [&failed] {
		    failed = true;
	    }));
	io.run();

	EXPECT_TRUE(failed);
}

TEST(ConnectionPoolTest, RejectsInvalidUrlWithoutCallingBack)
{
	boost::asio::io_context io;
	connection_pool pool {&io};

	EXPECT_FALSE(pool.get("not a url", [](http_response *) {}, [] {}));
}
