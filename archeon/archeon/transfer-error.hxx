#pragma once

#include <string>
#include <ostream>
#include <stdexcept>

namespace archeon
{
  // Transfer failure kinds.
  //
  // Every failure that the pipeline can produce maps to exactly one of these.
  // Nothing is retried, so the kind is mostly useful for diagnostics and for
  // tests that want to check we failed for the right reason.
  //
  enum class transfer_errc
  {
    uri_parse,              // Malformed input URL.
    staging_dir,            // Cannot create the staging directory.
    http_transport,         // Resolve, TCP, TLS, or HTTP framing failure.
    http_status,            // Non-success final status on GET.
    missing_content_length, // HEAD response without a usable Content-Length.
    body_drain,             // Error while reading the body, or short body.
    file_io,                // Create, write, or stat failure on the file.
    install_spawn           // Cannot locate or spawn the installer.
  };

  std::string
  to_string (transfer_errc);

  inline std::ostream&
  operator<< (std::ostream& o, transfer_errc e)
  {
    return o << to_string (e);
  }

  // The single error surface of the library.
  //
  // The what() string is the human-readable diagnostic (without the kind
  // prefix), suitable for printing after "error: ".
  //
  class transfer_error: public std::runtime_error
  {
  public:
    transfer_error (transfer_errc e, const std::string& what)
      : std::runtime_error (what), code_ (e) {}

    transfer_errc
    code () const noexcept
    {
      return code_;
    }

  private:
    transfer_errc code_;
  };
}
