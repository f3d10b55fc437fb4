#pragma once

#include <string>
#include <memory>

#include <boost/asio/io_context.hpp>

#include <archeon/transfer.hxx>

namespace archeon
{
  namespace asio = boost::asio;

  // Top-level handle.
  //
  // Igniting sets up the transfer for the specified URL (parsing it and
  // preparing the staging directory) and hands back a handle that owns it.
  // Everything past that point is driven through staged().
  //
  class core
  {
  public:
    static core
    ignite (asio::io_context&, const std::string& url);

    bool
    ignited () const noexcept
    {
      return transfer_ != nullptr;
    }

    transfer&
    staged ();

  private:
    explicit
    core (std::unique_ptr<transfer>);

  private:
    std::unique_ptr<transfer> transfer_;
  };
}
