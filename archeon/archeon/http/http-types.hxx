#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <utility>
#include <optional>

namespace archeon
{
  // HTTP request methods.
  //
  // We only ever issue HEAD and GET.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status codes.
  //
  // Only the ones we refer to by name are listed. Anything else is still
  // representable through the underlying value.
  //
  enum class http_status: std::uint16_t
  {
    ok        = 200,
    found     = 302,
    not_found = 404
  };

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // HTTP protocol version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    constexpr
    http_version (std::uint8_t mj = 1, std::uint8_t mi = 1) noexcept
      : major (mj), minor (mi) {}

    std::string
    string () const;
  };

  inline bool
  operator== (const http_version& x, const http_version& y) noexcept
  {
    return x.major == y.major && x.minor == y.minor;
  }

  inline bool
  operator!= (const http_version& x, const http_version& y) noexcept
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // Header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
      : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x,
              const basic_http_field<S>& y) noexcept
  {
    return x.name == y.name && x.value == y.value;
  }

  // Header fields in wire order.
  //
  // Names are compared case-insensitively (RFC 7230) but stored verbatim.
  //
  template <typename S>
  class basic_http_headers
  {
  public:
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    using const_iterator = typename fields_type::const_iterator;

    fields_type fields;

    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value);

    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const;

    void
    remove (const string_type& name);

    bool
    empty () const noexcept {return fields.empty ();}

    std::size_t
    size () const noexcept {return fields.size ();}

    const_iterator
    begin () const noexcept {return fields.begin ();}

    const_iterator
    end () const noexcept {return fields.end ();}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_headers<S>& x,
              const basic_http_headers<S>& y) noexcept
  {
    return x.fields == y.fields;
  }

  using http_headers = basic_http_headers<std::string>;
}

#include <archeon/http/http-types.ixx>
