#include <archeon/uri.hxx>

#include <cctype>
#include <cstring>
#include <algorithm>

#include <archeon/transfer-error.hxx>

using namespace std;

namespace archeon
{
  string uri::
  target () const
  {
    if (path_and_query.empty ())
      return "/";

    // Something like http://host?x=1 has no path at all. The request line
    // still needs one.
    //
    if (path_and_query.front () == '?')
      return '/' + path_and_query;

    return path_and_query;
  }

  string uri::
  host_header () const
  {
    size_t p (authority.rfind ('@'));
    return p == std::string::npos ? authority : authority.substr (p + 1);
  }

  string uri::
  string () const
  {
    return scheme + "://" + authority + path_and_query;
  }

  static transfer_error
  invalid (const string& s, const string& why)
  {
    return transfer_error (transfer_errc::uri_parse,
                           "invalid URI '" + s + "': " + why);
  }

  // Characters that may never appear in a URI, escaped or not.
  //
  static bool
  forbidden (unsigned char c)
  {
    return c <= 0x20 || c >= 0x7f || strchr ("<>\"{}|\\^`", c) != nullptr;
  }

  // ALPHA *(ALPHA / DIGIT / "+" / "-" / ".") over the first n characters.
  //
  static bool
  valid_scheme (const string& s, size_t n)
  {
    if (n == 0 || !isalpha (static_cast<unsigned char> (s[0])))
      return false;

    for (size_t i (1); i != n; ++i)
    {
      unsigned char c (static_cast<unsigned char> (s[i]));

      if (!isalnum (c) && c != '+' && c != '-' && c != '.')
        return false;
    }

    return true;
  }

  uri
  parse_uri (const std::string& s)
  {
    if (s.empty ())
      throw invalid (s, "empty string");

    for (unsigned char c: s)
    {
      if (forbidden (c))
        throw invalid (s, "invalid character");
    }

    uri r;

    // Scheme.
    //
    size_t p (s.find ("://"));
    if (p == string::npos || p == 0)
      throw invalid (s, "missing scheme");

    r.scheme = s.substr (0, p);

    if (!valid_scheme (r.scheme, p))
      throw invalid (s, "invalid scheme");

    for (char& c: r.scheme)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    if (r.scheme != "http" && r.scheme != "https")
      throw invalid (s, "unsupported scheme '" + r.scheme + "'");

    // Authority.
    //
    // It runs until the start of the path, query, or fragment, whichever
    // comes first.
    //
    size_t b (p + 3);
    size_t e (s.find_first_of ("/?#", b));
    if (e == string::npos)
      e = s.size ();

    r.authority = s.substr (b, e - b);

    if (r.authority.empty ())
      throw invalid (s, "missing authority");

    std::string hp (r.host_header ());
    std::string port;
    bool has_port (false);

    if (hp.empty ())
      throw invalid (s, "missing host");

    if (hp.front () == '[')
    {
      // IPv6 literal. The resolver wants it without the brackets.
      //
      size_t c (hp.find (']'));
      if (c == string::npos)
        throw invalid (s, "unterminated IPv6 literal");

      r.host = hp.substr (1, c - 1);

      std::string t (hp.substr (c + 1));
      if (!t.empty ())
      {
        if (t.front () != ':')
          throw invalid (s, "junk after IPv6 literal");

        port = t.substr (1);
        has_port = true;
      }
    }
    else
    {
      size_t c (hp.find (':'));
      r.host = hp.substr (0, c);

      if (c != string::npos)
      {
        port = hp.substr (c + 1);
        has_port = true;
      }
    }

    if (r.host.empty ())
      throw invalid (s, "missing host");

    if (has_port)
    {
      if (port.empty () || port.size () > 5 ||
          !all_of (port.begin (), port.end (),
                   [] (unsigned char c) {return isdigit (c) != 0;}))
        throw invalid (s, "invalid port");

      if (stoul (port) > 65535)
        throw invalid (s, "port out of range");

      r.port = port;
    }
    else
      r.port = r.secure () ? "443" : "80";

    // Path and query.
    //
    // Note that the fragment is a client-side thing and never goes on the
    // wire, so we drop it here.
    //
    size_t f (s.find ('#', e));
    r.path_and_query = s.substr (e, f == string::npos ? f : f - e);

    return r;
  }

  // True if the reference starts with a scheme and its ':', ahead of any
  // '/', '?' or '#'. Note that a relative reference may still carry "://"
  // in its query.
  //
  static bool
  absolute_reference (const std::string& l)
  {
    size_t c (l.find_first_of (":/?#"));
    return c != std::string::npos && l[c] == ':' && valid_scheme (l, c);
  }

  uri
  resolve_uri (const uri& b, const std::string& l)
  {
    if (l.empty ())
      throw invalid (l, "empty redirect location");

    if (absolute_reference (l))
      return parse_uri (l);

    if (l.compare (0, 2, "//") == 0)
      return parse_uri (b.scheme + ':' + l);

    if (l.front () == '/')
      return parse_uri (b.scheme + "://" + b.authority + l);

    // Path-relative. Replace the last segment of the base path.
    //
    std::string d (b.target ());
    d = d.substr (0, d.find ('?'));
    d = d.substr (0, d.rfind ('/') + 1);

    return parse_uri (b.scheme + "://" + b.authority + d + l);
  }
}
