#include <chrono>
#include <utility>

#include <boost/system/system_error.hpp>

#include <archeon/transfer-error.hxx>

namespace archeon
{
  template <typename T>
  basic_http_client<T>::
  basic_http_client (asio::io_context& i, traits_type t)
    : ioc_ (i),
      ssl_ (ssl::context::tls_client),
      traits_ (std::move (t))
  {
    // Use whatever trust store the system OpenSSL is configured with.
    //
    ssl_.set_default_verify_paths ();
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  head (const uri& u)
  {
    stream_response_type s (
      co_await open (request_type (http_method::head, u), 0));

    response_type r;
    r.status  = s.status;
    r.version = s.version;
    r.reason  = std::move (s.reason);
    r.headers = std::move (s.headers);

    // The body was skipped by the parser, but drain anyway in case the
    // server sent something we still need to get off the wire.
    //
    string_type b (co_await to_bytes (**s.body));

    if (!b.empty ())
      r.body = std::move (b);

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::stream_response_type>
  basic_http_client<T>::
  get (const uri& u)
  {
    co_return co_await open (request_type (http_method::get, u), 0);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::string_type>
  basic_http_client<T>::
  to_bytes (http_stream& s)
  {
    string_type r;
    char b[8192];

    try
    {
      while (!s.done ())
      {
        std::size_t n (co_await s.read_some (b, sizeof (b)));
        r.append (b, n);
      }
    }
    catch (const boost::system::system_error& e)
    {
      throw transfer_error (transfer_errc::body_drain,
                            "unable to read response body: " +
                            e.code ().message ());
    }

    co_return r;
  }

  // Open the exchange and follow redirects.
  //
  template <typename T>
  asio::awaitable<typename basic_http_client<T>::stream_response_type>
  basic_http_client<T>::
  open (request_type rq, std::uint8_t redirect_count)
  {
    using std::chrono::milliseconds;

    if (redirect_count > traits_.max_redirects)
      throw transfer_error (transfer_errc::http_transport,
                            "maximum redirects exceeded at " +
                            rq.url.string ());

    rq.set_header (string_type ("User-Agent"), traits_.user_agent);
    rq.normalize ();

    auto s (std::make_unique<http_stream> (
              ioc_,
              ssl_,
              milliseconds (traits_.connect_timeout),
              milliseconds (traits_.request_timeout)));

    try
    {
      co_await s->open (rq, traits_.verify_peer);
    }
    catch (const boost::system::system_error& e)
    {
      throw transfer_error (transfer_errc::http_transport,
                            to_string (rq.method) + ' ' + rq.url.string () +
                            ": " + e.code ().message ());
    }

    const http_stream::header_type& h (s->header ());

    stream_response_type r;
    r.status  = static_cast<http_status> (h.result_int ());
    r.version = http_version (static_cast<std::uint8_t> (h.version () / 10),
                              static_cast<std::uint8_t> (h.version () % 10));
    r.reason  = string_type (h.reason ());

    for (const auto& f: h)
      r.headers.add (string_type (f.name_string ()),
                     string_type (f.value ()));

    // Note that we start over with a fresh request rather than copying the
    // old one: the Host header has to follow the new authority.
    //
    if (traits_.follow_redirects && r.is_redirection ())
    {
      if (auto l = r.location ())
      {
        s->close ();

        request_type nx (rq.method, resolve_uri (rq.url, *l), rq.version);

        if (rq.url.secure () && !nx.url.secure ())
          throw transfer_error (transfer_errc::http_transport,
                                "refusing redirect from " + rq.url.string () +
                                " to insecure " + nx.url.string ());

        co_return co_await open (std::move (nx),
                                 static_cast<std::uint8_t> (
                                   redirect_count + 1));
      }
    }

    r.body = std::move (s);
    co_return r;
  }
}
