#include <archeon/http/http-stream.hxx>

#include <limits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

using namespace std;

namespace archeon
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  http_stream::
  http_stream (asio::io_context& i,
               ssl::context& s,
               chrono::milliseconds ct,
               chrono::milliseconds it)
    : ioc_ (i),
      ssl_ (s),
      connect_timeout_ (ct),
      io_timeout_ (it)
  {
    // Default is 8MB which is nowhere near enough for a package.
    //
    parser_.body_limit (numeric_limits<uint64_t>::max ());
  }

  http_stream::
  ~http_stream ()
  {
    close ();
  }

  beast::tcp_stream& http_stream::
  layer ()
  {
    return tls_ ? beast::get_lowest_layer (*tls_) : *tcp_;
  }

  asio::awaitable<void> http_stream::
  connect (const uri& u, bool verify)
  {
    tcp::resolver rslv (ioc_);
    auto addrs (co_await rslv.async_resolve (u.host,
                                             u.port,
                                             asio::use_awaitable));

    if (!u.secure ())
    {
      tcp_.emplace (ioc_);
      tcp_->expires_after (connect_timeout_);
      co_await tcp_->async_connect (addrs, asio::use_awaitable);
      co_return;
    }

    tls_.emplace (ioc_, ssl_);

    // Set the SNI host name. Beast doesn't wrap this so we have to drop down
    // to the OpenSSL API. Without it many CDNs will serve the wrong
    // certificate or refuse the handshake altogether. Address literals are
    // not allowed as SNI (RFC 6066).
    //
    beast::error_code ac;
    asio::ip::make_address (u.host, ac);

    if (ac &&
        !SSL_set_tlsext_host_name (tls_->native_handle (), u.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());

      throw beast::system_error (ec, "unable to set SNI host name");
    }

    if (verify)
    {
      tls_->set_verify_mode (ssl::verify_peer);
      tls_->set_verify_callback (ssl::host_name_verification (u.host));
    }
    else
      tls_->set_verify_mode (ssl::verify_none);

    auto& l (beast::get_lowest_layer (*tls_));

    l.expires_after (connect_timeout_);
    co_await l.async_connect (addrs, asio::use_awaitable);

    l.expires_after (io_timeout_);
    co_await tls_->async_handshake (ssl::stream_base::client,
                                    asio::use_awaitable);
  }

  asio::awaitable<void> http_stream::
  open (const http_request& r, bool verify)
  {
    co_await connect (r.url, verify);

    http::request<http::empty_body> br;
    br.method (r.method == http_method::head
               ? http::verb::head
               : http::verb::get);
    br.target (r.target ());
    br.version (r.version.major * 10 + r.version.minor);

    for (const auto& h: r.headers)
      br.set (h.name, h.value);

    layer ().expires_after (io_timeout_);

    if (tls_)
      co_await http::async_write (*tls_, br, asio::use_awaitable);
    else
      co_await http::async_write (*tcp_, br, asio::use_awaitable);

    // A HEAD response carries the Content-Length of the would-be GET body
    // but no body. Unless told, the parser would wait for those bytes.
    //
    if (r.method == http_method::head)
      parser_.skip (true);

    layer ().expires_after (io_timeout_);

    if (tls_)
      co_await http::async_read_header (*tls_, buffer_, parser_,
                                        asio::use_awaitable);
    else
      co_await http::async_read_header (*tcp_, buffer_, parser_,
                                        asio::use_awaitable);
  }

  asio::awaitable<size_t> http_stream::
  read_some (char* d, size_t n)
  {
    if (parser_.is_done ())
      co_return 0;

    auto& b (parser_.get ().body ());
    b.data = d;
    b.size = n;

    // Keep pushing the deadline while the data flows. A large package on a
    // slow link can easily outlive any single fixed timeout.
    //
    layer ().expires_after (io_timeout_);

    beast::error_code ec;

    if (tls_)
      co_await http::async_read (*tls_, buffer_, parser_,
                                 asio::redirect_error (asio::use_awaitable,
                                                       ec));
    else
      co_await http::async_read (*tcp_, buffer_, parser_,
                                 asio::redirect_error (asio::use_awaitable,
                                                       ec));

    // need_buffer just means our chunk is full.
    //
    if (ec == http::error::need_buffer)
      ec = {};

    if (ec)
      throw beast::system_error (ec);

    co_return n - b.size;
  }

  void http_stream::
  close () noexcept
  {
    // Note that we skip the TLS shutdown: plenty of servers never answer
    // close_notify and we would just sit there until the timeout.
    //
    if (tls_)
      beast::get_lowest_layer (*tls_).close ();
    else if (tcp_)
      tcp_->close ();
  }
}
