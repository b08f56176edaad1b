#ifndef CONNECTION_H

#define CONNECTION_H

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/ssl.h>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = asio::ssl;
using tcp = boost::asio::ip::tcp;

static const std::string http_port = "80";
static const std::string https_port = "443";
static const unsigned http_version = 11;
static const char port_delimiter = ':';
static const std::chrono::seconds timeout {30};
static const char user_agent[] =
    "Mozilla/5.0 (X11; Ubuntu; Linux x86_64; rv:69.0) Gecko/20100101 Firefox/69.0";

class connection : public std::enable_shared_from_this<connection> {
	public:
		typedef http::response<http::vector_body<char>> http_response;
		typedef http::response_parser<http::buffer_body> stream_parser;
		typedef std::function<void(const std::string&)> on_error_callback;
		typedef std::function<void(const std::shared_ptr<connection>&, http_response *)>
		    on_receive_callback;
		typedef std::function<void(const http::response_header<>&)> on_header_callback;
		// Receives the number of body bytes stored in the chunk buffer and whether the
		// body is complete.
		typedef std::function<void(size_t, bool)> on_chunk_callback;

	private:
		beast::flat_buffer buffer;
		on_receive_callback on_receive_cb;
		on_header_callback on_header_cb;
		on_chunk_callback on_chunk_cb;
		http::request<http::empty_body> request;
		http_response response;
		std::optional<stream_parser> parser;
		beast::error_code last_error;
		tcp::resolver * const resolver = nullptr;
		size_t chunk_capacity = 0;
		size_t sequence_number = 0;
		bool connected = false;

		virtual void async_read()
		{
			auto& stream = get_tcp_stream();

			stream.expires_after(timeout);
			do_async_read(stream);
		}

		virtual void async_read_chunk()
		{
			auto& stream = get_tcp_stream();

			stream.expires_after(timeout);
			do_async_read_chunk(stream);
		}

		virtual void async_read_header()
		{
			auto& stream = get_tcp_stream();

			stream.expires_after(timeout);
			do_async_read_header(stream);
		}

		virtual void async_write()
		{
			auto& stream = get_tcp_stream();

			stream.expires_after(timeout);
			do_async_write(stream);
		}

		virtual beast::tcp_stream& get_tcp_stream() = 0;

		void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
		{
			if (ec)
				fail(ec, "Failed to connect to: ");
			else
				post_connect();
		}

		void on_read(beast::error_code ec, size_t)
		{
			if (ec)
				fail(ec, "Failed to read response from: ");
			else
				on_receive_cb(shared_from_this(), &response);
		}

		void on_read_chunk(beast::error_code ec, size_t)
		{
			bool done = parser->is_done();

			// A full chunk buffer is not an error; the parser simply needs more room.
			if (ec == http::error::need_buffer)
				ec = {};
			// Servers commonly drop TLS streams without a close_notify.
			else if (ec == ssl::error::stream_truncated) {
				ec = {};
				done = true;
			}

			if (ec)
				fail(ec, "Failed to read response body from: ");
			else
				on_chunk_cb(chunk_capacity - parser->get().body().size, done);
		}

		void on_read_header(beast::error_code ec, size_t)
		{
			if (ec)
				fail(ec, "Failed to read response header from: ");
			else
				on_header_cb(parser->get());
		}

		void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
		{
			if (ec)
				fail(ec, "Failed to resolve: ");
			else {
				BOOST_LOG_TRIVIAL(trace) << "Establishing connection "
							 << sequence_number << " to: " << host;

				if (pre_connect()) {
					auto& stream = get_tcp_stream();

					stream.expires_after(timeout);
					stream.async_connect(
					    results,
					    beast::bind_front_handler(&connection::on_connect,
								      shared_from_this()));
				}
				else
					fail(asio::error::invalid_argument, "Failed to configure TLS for: ");
			}
		}

		void on_write(beast::error_code ec, size_t)
		{
			if (ec)
				fail(ec, "Failed to send request to: ");
			else if (parser)
				async_read_header();
			else {
				response = http::response<http::vector_body<char>> {};
				async_read();
			}
		}

		virtual bool pre_connect()
		{
			return true;
		}

		void send(const std::string_view& resource)
		{
			request.method(http::verb::get);
			request.target(beast::string_view {resource.data(), resource.size()});

			if (connected)
				async_write();
			else {
				const std::string_view h {host};

				resolver->async_resolve(
				    h.substr(0, port_pos),
				    h.substr(port_pos + 1),
				    beast::bind_front_handler(&connection::on_resolve,
							      shared_from_this()));
			}
		}

	protected:
		std::string host;
		on_error_callback on_error;
		std::string_view::size_type port_pos = 0;

		connection(size_t sequence_number,
			   const std::string_view& h,
			   tcp::resolver *resolver) :
		    resolver(resolver),
		    sequence_number(sequence_number), host(h)
		{
			request.version(http_version);
			request.set(http::field::user_agent, user_agent);
			port_pos = host.find(port_delimiter);

			const std::string_view port {std::string_view {host}.substr(port_pos + 1)};

			// The Host field carries the port only when it is not the scheme default.
			if (port == http_port || port == https_port)
				request.set(http::field::host, host.substr(0, port_pos));
			else
				request.set(http::field::host, host);
		}

		connection(const connection&) = default;
		connection(connection&&) = default;
		virtual ~connection() = default;

		template<typename stream> void do_async_read(stream& s)
		{
			http::async_read(
			    s,
			    buffer,
			    response,
			    beast::bind_front_handler(&connection::on_read, shared_from_this()));
		}

		template<typename stream> void do_async_read_chunk(stream& s)
		{
			http::async_read_some(
			    s,
			    buffer,
			    *parser,
			    beast::bind_front_handler(&connection::on_read_chunk, shared_from_this()));
		}

		template<typename stream> void do_async_read_header(stream& s)
		{
			http::async_read_header(
			    s,
			    buffer,
			    *parser,
			    beast::bind_front_handler(&connection::on_read_header, shared_from_this()));
		}

		template<typename stream> void do_async_write(stream& s)
		{
			http::async_write(
			    s,
			    request,
			    beast::bind_front_handler(&connection::on_write, shared_from_this()));
		}

		void fail(const beast::error_code& ec, const char *what)
		{
			last_error = ec;
			BOOST_LOG_TRIVIAL(error) << what << host << " Error code: " << ec.message();
			on_error(host);
		}

		virtual void post_connect()
		{
			connected = true;
			async_write();
		}

	public:
		void get(const std::string_view& resource,
			 on_receive_callback&& on_receive_fn,
			 on_error_callback&& on_error_cb)
		{
			parser.reset();
			on_error = std::move(on_error_cb);
			on_receive_cb = std::move(on_receive_fn);
			send(resource);
		}

		const beast::error_code& get_last_error() const noexcept
		{
			return last_error;
		}

		const std::string& get_host() const noexcept
		{
			return host;
		}

		// Sends a GET request and reads only the response header. The body is then
		// consumed through read_chunk().
		void open_stream(const std::string_view& resource,
				 on_header_callback&& on_header_fn,
				 on_error_callback&& on_error_cb)
		{
			parser.emplace();
			parser->body_limit((std::numeric_limits<std::uint64_t>::max)());
			on_error = std::move(on_error_cb);
			on_header_cb = std::move(on_header_fn);
			send(resource);
		}

		void read_chunk(char *data, size_t size, on_chunk_callback&& on_chunk_fn)
		{
			auto& body = parser->get().body();

			body.data = data;
			body.size = size;
			body.more = true;
			chunk_capacity = size;
			on_chunk_cb = std::move(on_chunk_fn);

			// Bodiless responses are complete as soon as the header has been read.
			if (parser->is_done())
				on_chunk_cb(0, true);
			else
				async_read_chunk();
		}
};

class http_connection : public virtual connection {
		beast::tcp_stream stream;

		beast::tcp_stream& get_tcp_stream() override
		{
			return stream;
		}

	public:
		http_connection(size_t sequence_number,
				const std::string_view& h,
				asio::io_context *io,
				tcp::resolver *resolver) :
		    connection(sequence_number, h, resolver),
		    stream(*io)
		{
		}
};

class https_connection : public virtual connection {
		beast::ssl_stream<beast::tcp_stream> stream;

		void async_read() override
		{
			get_tcp_stream().expires_after(timeout);
			do_async_read(stream);
		}

		void async_read_chunk() override
		{
			get_tcp_stream().expires_after(timeout);
			do_async_read_chunk(stream);
		}

		void async_read_header() override
		{
			get_tcp_stream().expires_after(timeout);
			do_async_read_header(stream);
		}

		void async_write() override
		{
			get_tcp_stream().expires_after(timeout);
			do_async_write(stream);
		}

		beast::tcp_stream& get_tcp_stream() override
		{
			return beast::get_lowest_layer(stream);
		}

		void on_handshake(beast::error_code ec)
		{
			if (ec)
				fail(ec, "Failed TLS handshake with: ");
			else
				connection::post_connect();
		}

		void post_connect() override
		{
			auto c = std::dynamic_pointer_cast<https_connection>(shared_from_this());

			get_tcp_stream().expires_after(timeout);
			stream.async_handshake(
			    asio::ssl::stream_base::client,
			    beast::bind_front_handler(&https_connection::on_handshake, c));
		}

		bool pre_connect() override
		{
			const std::string h {host.substr(0, port_pos)};

			return !!SSL_set_tlsext_host_name(stream.native_handle(), h.c_str());
		}

	public:
		https_connection(size_t sequence_number,
				 const std::string_view& h,
				 asio::io_context *io,
				 tcp::resolver *resolver,
				 ssl::context *tls_context) :
		    connection(sequence_number, h, resolver),
		    stream(*io, *tls_context)
		{
		}
};

// Appends the scheme default port to a host that does not name one.
inline std::string host_with_port(bool is_https, const std::string_view& host)
{
	std::string h {host};

	if (host.find(port_delimiter) == std::string_view::npos) {
		h.push_back(port_delimiter);
		h.append(is_https ? https_port : http_port);
	}

	return h;
}

inline std::shared_ptr<connection> make_connection(bool is_https,
						   size_t sequence_number,
						   const std::string_view& host,
						   asio::io_context *io,
						   tcp::resolver *resolver,
						   ssl::context *tls_context)
{
	const std::string h {host_with_port(is_https, host)};

	return is_https ? std::static_pointer_cast<connection>(std::make_shared<https_connection>(
			      sequence_number, h, io, resolver, tls_context))
			: std::static_pointer_cast<connection>(
			      std::make_shared<http_connection>(sequence_number, h, io, resolver));
}

#endif // CONNECTION_H
