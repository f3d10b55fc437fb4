#include <archeon/transfer-error.hxx>

using namespace std;

namespace archeon
{
  string
  to_string (transfer_errc e)
  {
    switch (e)
    {
      case transfer_errc::uri_parse:              return "uri-parse";
      case transfer_errc::staging_dir:            return "staging-dir";
      case transfer_errc::http_transport:         return "http-transport";
      case transfer_errc::http_status:            return "http-status";
      case transfer_errc::missing_content_length: return "missing-content-length";
      case transfer_errc::body_drain:             return "body-drain";
      case transfer_errc::file_io:                return "file-io";
      case transfer_errc::install_spawn:          return "install-spawn";
    }

    return "unknown";
  }
}
