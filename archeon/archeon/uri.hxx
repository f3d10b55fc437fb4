#pragma once

#include <string>
#include <ostream>

namespace archeon
{
  // Absolute http(s) URI.
  //
  // We only need enough of RFC 3986 to talk HTTP/1.1 to a single authority,
  // so the representation is split along the lines of what goes on the wire:
  // the scheme picks the transport, host/port feed the resolver, and
  // path_and_query becomes the request target.
  //
  struct uri
  {
    std::string scheme;         // "http" or "https", always lower case.
    std::string authority;      // [userinfo@]host[:port], verbatim.
    std::string host;           // Host name, IPv6 literals without brackets.
    std::string port;           // Explicit port or the scheme default.
    std::string path_and_query; // Verbatim, may be empty. No fragment.

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    // Request target (origin-form). Empty path becomes "/".
    //
    std::string
    target () const;

    // Authority without userinfo, suitable for the Host header.
    //
    std::string
    host_header () const;

    std::string
    string () const;
  };

  inline bool
  operator== (const uri& x, const uri& y) noexcept
  {
    return x.scheme == y.scheme &&
           x.authority == y.authority &&
           x.path_and_query == y.path_and_query;
  }

  inline bool
  operator!= (const uri& x, const uri& y) noexcept
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& o, const uri& u)
  {
    return o << u.string ();
  }

  // Parse an absolute http or https URI.
  //
  // Throw transfer_error with transfer_errc::uri_parse if the string is not
  // well-formed or uses another scheme.
  //
  uri
  parse_uri (const std::string&);

  // Resolve a Location header value against the URI that produced it.
  //
  // Handles absolute URIs, scheme-relative (//host/...), origin-relative
  // (/path) and path-relative references.
  //
  uri
  resolve_uri (const uri& base, const std::string& location);
}
