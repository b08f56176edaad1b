#ifndef TEST_HTTP_SERVER_H

#define TEST_HTTP_SERVER_H

#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// Blocking HTTP/1.1 server on the loopback interface. Every connection is served on a
// thread of its own: the request is read, handed to the handler, and the connection is
// closed once the handler returns.
class test_http_server {
	public:
		typedef http::request<http::string_body> http_request;
		typedef std::function<void(test_http_server&, tcp::socket&, const http_request&)>
		    handler;

	private:
		asio::io_context io;
		tcp::acceptor acceptor;
		handler on_request;
		std::thread accept_thread;
		std::mutex mutex;
		std::list<std::thread> connection_threads;
		std::atomic<size_t> num_requests {0};
		std::atomic<bool> stopping {false};
		unsigned short port = 0;

		void accept_loop()
		{
			for (;;) {
				boost::system::error_code ec;
				tcp::socket socket {io};

				acceptor.accept(socket, ec);

				if (stopping || ec)
					break;

				std::lock_guard<std::mutex> lock {mutex};

				connection_threads.emplace_back(
				    [this, s = std::move(socket)]() mutable { serve(s); });
			}
		}

		void serve(tcp::socket& socket)
		{
			beast::flat_buffer buffer;
			boost::system::error_code ec;
			http_request request;

			http::read(socket, buffer, request, ec);

			if (ec)
				return;

			num_requests++;
			on_request(*this, socket, request);
			socket.shutdown(tcp::socket::shutdown_both, ec);
		}

	public:
		explicit test_http_server(handler h) :
		    acceptor(io, tcp::endpoint {asio::ip::make_address("127.0.0.1"), 0}),
		    on_request(std::move(h)), port(acceptor.local_endpoint().port())
		{
			accept_thread = std::thread(&test_http_server::accept_loop, this);
		}

		test_http_server(const test_http_server&) = delete;
		test_http_server& operator=(const test_http_server&) = delete;

		~test_http_server()
		{
			stopping = true;

			{
				// Wakes the blocking accept.
				boost::system::error_code ec;
				tcp::socket socket {io};

				socket.connect(tcp::endpoint {asio::ip::make_address("127.0.0.1"), port},
					       ec);
				accept_thread.join();
			}

			for (auto& t : connection_threads)
				t.join();
		}

		bool is_stopping() const noexcept
		{
			return stopping;
		}

		size_t requests() const noexcept
		{
			return num_requests;
		}

		std::string url(const std::string_view& resource) const
		{
			std::string ret {"http://127.0.0.1:"};

			ret.append(std::to_string(port));
			ret.append(resource);
			return ret;
		}
};

// Returns a loopback URL on which nothing is listening.
inline std::string refused_url(const std::string_view& resource)
{
	asio::io_context io;
	tcp::acceptor acceptor {io, tcp::endpoint {asio::ip::make_address("127.0.0.1"), 0}};
	std::string ret {"http://127.0.0.1:"};

	ret.append(std::to_string(acceptor.local_endpoint().port()));
	ret.append(resource);
	return ret;
}

inline bool write_raw(tcp::socket& socket, const std::string_view& data)
{
	boost::system::error_code ec;

	asio::write(socket, asio::buffer(data.data(), data.size()), ec);
	return !ec;
}

inline void respond(tcp::socket& socket,
		    http::status status,
		    const std::string& body,
		    const std::string& content_type = "application/json")
{
	boost::system::error_code ec;
	http::response<http::string_body> response {status, 11};

	response.set(http::field::content_type, content_type);
	response.keep_alive(false);
	response.body() = body;
	response.prepare_payload();
	http::write(socket, response, ec);
}

inline void redirect(tcp::socket& socket, const std::string& location)
{
	write_raw(socket,
		  "HTTP/1.1 302 Found\r\nLocation: " + location +
		      "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
}

// Sends a close-delimited audio body of count chunks (endless when count is zero), one
// chunk per interval, until the client goes away or the server stops.
inline void stream_chunks(test_http_server& server,
			  tcp::socket& socket,
			  size_t chunk_size,
			  size_t count,
			  std::chrono::milliseconds interval)
{
	const std::string chunk(chunk_size, 'x');

	if (!write_raw(socket,
		       "HTTP/1.1 200 OK\r\nContent-Type: audio/mpeg\r\nConnection: close\r\n\r\n"))
		return;

	for (size_t i = 0; !count || i < count; i++) {
		if (server.is_stopping() || !write_raw(socket, chunk))
			return;

		std::this_thread::sleep_for(interval);
	}
}

#endif // TEST_HTTP_SERVER_H
