#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <filesystem>

#include <boost/asio/awaitable.hpp>

namespace archeon
{
  namespace fs   = std::filesystem;
  namespace asio = boost::asio;

  // Outcome of an installer run. The exit code is reported, not judged.
  //
  struct install_result
  {
    int exit_code = 0;
    std::string out;
    std::string err;

    bool
    success () const noexcept
    {
      return exit_code == 0;
    }
  };

  // Print the result in the "exit status / stdout / stderr" layout.
  //
  std::ostream&
  operator<< (std::ostream&, const install_result&);

  // Package installer shim.
  //
  // Runs `<program> --install <file>` in the specified working directory,
  // collects both output streams, and waits for the exit. A program name
  // without a directory separator is looked up in PATH.
  //
  class installer
  {
  public:
    explicit
    installer (std::string program = "dpkg");

    const std::string&
    program () const noexcept
    {
      return program_;
    }

    // Throw transfer_error (install_spawn) if the program cannot be found
    // or started.
    //
    asio::awaitable<install_result>
    install (const fs::path& dir, const std::string& file) const;

    // Synchronous version of the above.
    //
    install_result
    run (const fs::path& dir, const std::string& file) const;

    // Resolve the program to an absolute path, the way run() would.
    //
    fs::path
    resolve () const;

  private:
    std::string program_;
  };
}
