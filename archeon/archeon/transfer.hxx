#pragma once

#include <string>
#include <utility>
#include <memory>
#include <ostream>
#include <filesystem>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <archeon/uri.hxx>
#include <archeon/installer.hxx>
#include <archeon/http/http-client.hxx>

namespace archeon
{
  namespace fs   = std::filesystem;
  namespace asio = boost::asio;

  // Return the local file name for a request target: whatever follows the
  // last slash, or the whole thing if there is none. Nothing is decoded or
  // stripped, the query included.
  //
  std::string
  derive_filename (const std::string& path_and_query);

  // Download of a single package into the staging directory followed by an
  // optional install.
  //
  // Construction parses the URL and makes sure the staging directory is in
  // place; nothing touches the network until launch(). The expected
  // sequence is launch() and then install(), once each. Any failure is
  // reported as transfer_error and leaves the transfer unusable.
  //
  class transfer
  {
  public:
    using client_type = http_client;

    transfer (asio::io_context&,
              const std::string& url,
              client_type::traits_type = client_type::traits_type ());

    transfer (const transfer&) = delete;
    transfer& operator= (const transfer&) = delete;

    const archeon::uri&
    uri () const noexcept {return uri_;}

    const std::string&
    filename () const noexcept {return filename_;}

    const fs::path&
    temp_dir () const noexcept {return temp_dir_;}

    const fs::path&
    file_path () const noexcept {return file_path_;}

    client_type&
    client () noexcept {return *client_;}

    // Where the progress bar and installer diagnostics go. Standard output
    // unless changed.
    //
    void
    set_output (std::ostream& o) noexcept {out_ = &o;}

    void
    set_installer (archeon::installer i) {installer_ = std::move (i);}

    // Issue a HEAD request and return the Content-Length header value
    // verbatim.
    //
    asio::awaitable<std::string>
    content_length ();

    // Download the body into file_path(). On return the file holds exactly
    // as many bytes as the HEAD response advertised (or more, should the
    // server change its mind between the two requests).
    //
    asio::awaitable<void>
    launch ();

    // Run the installer on the downloaded file from within the staging
    // directory and print its outcome.
    //
    asio::awaitable<install_result>
    install ();

  private:
    // HEAD the URL and insist on a Content-Length header.
    //
    asio::awaitable<client_type::response_type>
    head ();

  private:
    archeon::uri uri_;
    std::string filename_;
    fs::path temp_dir_;
    fs::path file_path_;

    std::unique_ptr<client_type> client_;
    std::ostream* out_;
    archeon::installer installer_;
  };
}
