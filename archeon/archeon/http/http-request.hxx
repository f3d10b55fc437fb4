#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>

#include <archeon/uri.hxx>
#include <archeon/http/http-types.hxx>

namespace archeon
{
  // HTTP request.
  //
  // Bodies are never sent (we only issue HEAD and GET), so unlike the
  // response there is no body type parameter.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method;
    archeon::uri url;
    http_version version;
    headers_type headers;

    basic_http_request ()
      : method (http_method::get) {}

    basic_http_request (http_method m,
                        archeon::uri u,
                        http_version v = http_version (1, 1))
      : method (m), url (std::move (u)), version (v) {}

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    // Request target (origin-form) for the request line.
    //
    string_type
    target () const
    {
      return url.target ();
    }

    // Fill in the headers HTTP/1.1 requires and that we always send.
    //
    // Host is derived from the URI authority (sans userinfo). A Host that is
    // already set is assumed to be intentional and is left alone.
    //
    void
    normalize ();
  };

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S>& r) -> decltype (o)
  {
    return o << r.method << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string>;
}

#include <archeon/http/http-request.ixx>
