#include <archeon/version.hxx>

namespace archeon
{
  template <typename S>
  inline void basic_http_request<S>::
  normalize ()
  {
    if (!has_header (string_type ("Host")))
      set_header (string_type ("Host"), url.host_header ());

    if (!has_header (string_type ("User-Agent")))
      set_header (string_type ("User-Agent"),
                  string_type ("archeon/" ARCHEON_VERSION_STR));

    // We never reuse a connection, so say so upfront and let the server
    // close once it is done.
    //
    if (!has_header (string_type ("Connection")))
      set_header (string_type ("Connection"), string_type ("close"));
  }
}
