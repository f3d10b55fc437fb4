#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <cstddef>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <archeon/uri.hxx>
#include <archeon/http/http-types.hxx>
#include <archeon/http/http-request.hxx>

namespace archeon
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // Single HTTP/1.1 exchange over a plain or TLS connection.
  //
  // The lifetime is: open() connects (and handshakes for https), writes the
  // request, and reads the response header. The body is then pulled with
  // read_some() until done(). One stream carries exactly one exchange; the
  // connection is never reused.
  //
  // Low-level errors surface as boost::system::system_error. Mapping them
  // to something meaningful is the caller's business since only it knows
  // which phase of the transfer was in progress.
  //
  class http_stream
  {
  public:
    using parser_type = beast::http::response_parser<beast::http::buffer_body>;
    using header_type = beast::http::response_header<>;

    http_stream (asio::io_context&,
                 ssl::context&,
                 std::chrono::milliseconds connect_timeout,
                 std::chrono::milliseconds io_timeout);

    http_stream (const http_stream&) = delete;
    http_stream& operator= (const http_stream&) = delete;

    ~http_stream ();

    // Connect to the request's authority, send it, and read the response
    // header. For HEAD the parser is told not to expect a body regardless of
    // what Content-Length says.
    //
    asio::awaitable<void>
    open (const http_request&, bool verify_peer);

    const header_type&
    header () const
    {
      return parser_.get ().base ();
    }

    // Read up to n body bytes into d. Return the number of bytes stored,
    // which is 0 only once the body is complete.
    //
    asio::awaitable<std::size_t>
    read_some (char* d, std::size_t n);

    bool
    done () const
    {
      return parser_.is_done ();
    }

    // Close the connection without a TLS close_notify. Idempotent.
    //
    void
    close () noexcept;

  private:
    beast::tcp_stream&
    layer ();

    asio::awaitable<void>
    connect (const uri&, bool verify_peer);

  private:
    asio::io_context& ioc_;
    ssl::context& ssl_;

    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds io_timeout_;

    // Exactly one of these is engaged after connect().
    //
    std::optional<beast::tcp_stream> tcp_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls_;

    beast::flat_buffer buffer_;
    parser_type parser_;
  };
}
