#pragma once

#include <string>
#include <utility>
#include <memory>
#include <cstdint>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <archeon/uri.hxx>
#include <archeon/version.hxx>
#include <archeon/http/http-types.hxx>
#include <archeon/http/http-stream.hxx>
#include <archeon/http/http-request.hxx>
#include <archeon/http/http-response.hxx>

namespace archeon
{
  namespace asio = boost::asio;
  namespace ssl  = boost::asio::ssl;

  // Client configuration.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type = S;

    // Timeouts, in milliseconds. The I/O timeout is re-armed for every read
    // and write, so it bounds a stall rather than the whole transfer.
    //
    std::uint32_t connect_timeout = 30000;
    std::uint32_t request_timeout = 60000;

    bool         follow_redirects = true;
    std::uint8_t max_redirects = 10;

    // Verify the peer certificate chain against the system trust roots and
    // match it against the host name.
    //
    bool verify_peer = true;

    string_type user_agent = string_type ("archeon/" ARCHEON_VERSION_STR);
  };

  // HTTP/1.1 client.
  //
  // Each call opens a fresh connection; nothing is pooled. Errors are
  // reported as transfer_error: http_transport for anything up to and
  // including the response header, body_drain for the body. A redirect
  // from https to http is refused.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type          = T;
    using string_type          = typename traits_type::string_type;
    using request_type         = basic_http_request<string_type>;
    using response_type        = basic_http_response<string_type>;
    using stream_response_type =
      basic_http_response<string_type, std::unique_ptr<http_stream>>;

    explicit
    basic_http_client (asio::io_context&, traits_type = traits_type ());

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Issue a HEAD request. The returned response has no body.
    //
    asio::awaitable<response_type>
    head (const uri&);

    // Issue a GET request and return as soon as the header is in. The body
    // member holds the stream to read the payload from.
    //
    asio::awaitable<stream_response_type>
    get (const uri&);

    // Drain what is left of the body into a single buffer.
    //
    static asio::awaitable<string_type>
    to_bytes (http_stream&);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    // TLS context shared by all the connections of this client. Can be used
    // to trust additional certificate authorities.
    //
    ssl::context&
    ssl_context () noexcept
    {
      return ssl_;
    }

  private:
    asio::awaitable<stream_response_type>
    open (request_type, std::uint8_t redirect_count);

  private:
    asio::io_context& ioc_;
    ssl::context ssl_;
    traits_type traits_;
  };

  using http_client = basic_http_client<>;
}

#include <archeon/http/http-client.txx>
