#include <archeon/http/http-types.hxx>

#include <sstream>

using namespace std;

namespace archeon
{
  // http_method
  //
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return "GET";
      case http_method::head: return "HEAD";
    }
    return "GET";
  }

  // http_version
  //
  string http_version::
  string () const
  {
    ostringstream os;

    os << "HTTP/" << static_cast<unsigned> (major)
       << '.'     << static_cast<unsigned> (minor);

    return os.str ();
  }
}
