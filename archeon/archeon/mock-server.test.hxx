#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <exception>
#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

// In-process HTTP/1.1 server for tests.
//
// Listens on an ephemeral loopback port on the caller's io_context and
// answers from a fixed route table. Every connection serves exactly one
// request and is then closed. Given a TLS context it speaks https instead.
//
namespace archeon
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // Generate a key and a self-signed certificate for the subjectAltName san
  // (for example "IP:127.0.0.1" or "DNS:localhost") and install both into
  // the server context. Return the certificate in PEM so that a client can
  // be told to trust it.
  //
  inline std::string
  self_signed_certificate (ssl::context& ctx, const std::string& san)
  {
    auto check = [] (bool ok, const char* what)
    {
      if (!ok)
        throw std::runtime_error (std::string ("unable to ") + what);
    };

    std::unique_ptr<EVP_PKEY, decltype (&EVP_PKEY_free)> k (
      EVP_EC_gen ("P-256"), &EVP_PKEY_free);
    check (k != nullptr, "generate key");

    std::unique_ptr<X509, decltype (&X509_free)> x (X509_new (), &X509_free);
    check (x != nullptr, "allocate certificate");

    X509_set_version (x.get (), 2);
    ASN1_INTEGER_set (X509_get_serialNumber (x.get ()), 1);
    X509_gmtime_adj (X509_getm_notBefore (x.get ()), -3600);
    X509_gmtime_adj (X509_getm_notAfter (x.get ()), 24 * 3600);
    X509_set_pubkey (x.get (), k.get ());

    X509_NAME* n (X509_get_subject_name (x.get ()));
    X509_NAME_add_entry_by_txt (
      n, "CN", MBSTRING_ASC,
      reinterpret_cast<const unsigned char*> ("archeon test"), -1, -1, 0);
    X509_set_issuer_name (x.get (), n);

    X509V3_CTX v;
    X509V3_set_ctx_nodb (&v);
    X509V3_set_ctx (&v, x.get (), x.get (), nullptr, nullptr, 0);

    for (const auto& e: {std::make_pair (NID_basic_constraints,
                                         std::string ("critical,CA:TRUE")),
                         std::make_pair (NID_subject_alt_name, san)})
    {
      X509_EXTENSION* x3 (
        X509V3_EXT_conf_nid (nullptr, &v, e.first, e.second.c_str ()));
      check (x3 != nullptr, "create certificate extension");

      X509_add_ext (x.get (), x3, -1);
      X509_EXTENSION_free (x3);
    }

    check (X509_sign (x.get (), k.get (), EVP_sha256 ()) != 0,
           "sign certificate");

    check (SSL_CTX_use_certificate (ctx.native_handle (), x.get ()) == 1 &&
           SSL_CTX_use_PrivateKey (ctx.native_handle (), k.get ()) == 1,
           "install certificate");

    std::unique_ptr<BIO, decltype (&BIO_free)> b (BIO_new (BIO_s_mem ()),
                                                  &BIO_free);
    check (b != nullptr && PEM_write_bio_X509 (b.get (), x.get ()) == 1,
           "encode certificate");

    char* d (nullptr);
    long l (BIO_get_mem_data (b.get (), &d));

    return std::string (d, static_cast<std::size_t> (l));
  }

  struct mock_route
  {
    unsigned status = 200;
    std::string body;

    // Content-Length to advertise on HEAD. If absent, the body size is
    // used. If head_length is false, HEAD omits the header altogether.
    //
    std::optional<std::string> length;
    bool head_length = true;

    std::string location;

    // If set, GET advertises the full body length but sends only this many
    // bytes before closing the connection.
    //
    std::optional<std::size_t> truncate;
  };

  class mock_server
  {
  public:
    using tcp = asio::ip::tcp;

    // If tls is not NULL, it must outlive the server.
    //
    explicit
    mock_server (asio::io_context& ioc, ssl::context* tls = nullptr)
      : acceptor_ (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"),
                                       0)),
        tls_ (tls)
    {
      asio::co_spawn (ioc, accept (), asio::detached);
    }

    void
    route (std::string target, mock_route r)
    {
      routes_[std::move (target)] = std::move (r);
    }

    unsigned short
    port () const
    {
      return acceptor_.local_endpoint ().port ();
    }

    std::string
    authority () const
    {
      return "127.0.0.1:" + std::to_string (port ());
    }

    std::string
    url (const std::string& target) const
    {
      return (tls_ != nullptr ? "https://" : "http://") + authority () +
             target;
    }

    std::string
    url (const std::string& host, const std::string& target) const
    {
      return (tls_ != nullptr ? "https://" : "http://") + host + ':' +
             std::to_string (port ()) + target;
    }

    // "HEAD /x", "GET /x", ... in arrival order.
    //
    std::vector<std::string> requests;

    // Header values of the last request.
    //
    std::map<std::string, std::string> last_headers;

    // SNI host name of the last completed TLS handshake, empty if the client
    // sent none.
    //
    std::string last_server_name;

  private:
    asio::awaitable<void>
    accept ()
    {
      for (;;)
      {
        tcp::socket s (co_await acceptor_.async_accept (asio::use_awaitable));

        asio::co_spawn (acceptor_.get_executor (),
                        serve (std::move (s)),
                        asio::detached);
      }
    }

    asio::awaitable<void>
    serve (tcp::socket sock)
    {
      beast::tcp_stream s (std::move (sock));

      if (tls_ == nullptr)
      {
        co_await respond (s);
        co_return;
      }

      beast::ssl_stream<beast::tcp_stream> t (std::move (s), *tls_);

      // A client that does not accept our certificate gives up right here.
      //
      beast::error_code ec;
      co_await t.async_handshake (ssl::stream_base::server,
                                  asio::redirect_error (asio::use_awaitable,
                                                        ec));
      if (ec)
        co_return;

      const char* sn (SSL_get_servername (t.native_handle (),
                                          TLSEXT_NAMETYPE_host_name));
      last_server_name = sn != nullptr ? sn : "";

      co_await respond (t);
    }

    template <typename Stream>
    asio::awaitable<void>
    respond (Stream& s)
    {
      namespace http = beast::http;

      beast::flat_buffer b;
      http::request<http::empty_body> rq;

      co_await http::async_read (s, b, rq, asio::use_awaitable);

      std::string t (rq.target ());
      requests.push_back (std::string (rq.method_string ()) + ' ' + t);

      last_headers.clear ();
      for (const auto& f: rq)
        last_headers[std::string (f.name_string ())] = std::string (f.value ());

      auto i (routes_.find (t));

      if (i == routes_.end ())
      {
        http::response<http::string_body> rs (http::status::not_found, 11);
        rs.keep_alive (false);
        rs.body () = "not found";
        rs.prepare_payload ();

        co_await http::async_write (s, rs, asio::use_awaitable);
      }
      else if (rq.method () == http::verb::head)
      {
        const mock_route& r (i->second);

        http::response<http::empty_body> rs (
          static_cast<http::status> (r.status), 11);
        rs.keep_alive (false);

        if (r.head_length)
          rs.set (http::field::content_length,
                  r.length ? *r.length : std::to_string (r.body.size ()));

        if (!r.location.empty ())
          rs.set (http::field::location, r.location);

        co_await http::async_write (s, rs, asio::use_awaitable);
      }
      else if (i->second.truncate)
      {
        const mock_route& r (i->second);

        // Hand-written so that the advertised length can lie.
        //
        std::string m ("HTTP/1.1 200 OK\r\n"
                       "Content-Length: " + std::to_string (r.body.size ()) +
                       "\r\n"
                       "Connection: close\r\n"
                       "\r\n" + r.body.substr (0, *r.truncate));

        co_await asio::async_write (s, asio::buffer (m), asio::use_awaitable);
      }
      else
      {
        const mock_route& r (i->second);

        http::response<http::string_body> rs (
          static_cast<http::status> (r.status), 11);
        rs.keep_alive (false);
        rs.body () = r.body;

        if (!r.location.empty ())
          rs.set (http::field::location, r.location);

        rs.prepare_payload ();

        co_await http::async_write (s, rs, asio::use_awaitable);
      }

      beast::error_code ec;
      beast::get_lowest_layer (s).socket ().shutdown (tcp::socket::shutdown_send,
                                                      ec);
    }

  private:
    tcp::acceptor acceptor_;
    ssl::context* tls_;
    std::map<std::string, mock_route> routes_;
  };

  // Run the coroutine returned by f on the context until it completes and
  // rethrow whatever it threw. The context is left restartable so that
  // the server keeps accepting across calls.
  //
  template <typename F>
  void
  run_test (asio::io_context& ioc, F f)
  {
    std::exception_ptr e;

    asio::co_spawn (ioc,
                    f (),
                    [&e, &ioc] (std::exception_ptr x)
                    {
                      e = x;
                      ioc.stop ();
                    });

    ioc.restart ();
    ioc.run ();

    if (e)
      std::rethrow_exception (e);
  }
}
