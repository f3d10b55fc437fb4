#include <charconv>

namespace archeon
{
  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto v (get_header (string_type ("Content-Length")));

    if (!v || v->empty ())
      return std::nullopt;

    std::uint64_t n (0);

    // Note that from_chars is locale-independent and, unlike stoull, does
    // not accept leading whitespace or a sign. We also insist that the whole
    // value is consumed.
    //
    const char* e (v->data () + v->size ());
    auto r (std::from_chars (v->data (), e, n));

    if (r.ec == std::errc () && r.ptr == e)
      return n;

    return std::nullopt;
  }
}
