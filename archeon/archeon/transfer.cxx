#include <archeon/transfer.hxx>

#include <iostream>

#include <boost/system/system_error.hpp>

#include <archeon/staging.hxx>
#include <archeon/transfer-error.hxx>
#include <archeon/progress/progress-indicator.hxx>

using namespace std;

namespace archeon
{
  string
  derive_filename (const string& pq)
  {
    size_t p (pq.rfind ('/'));
    return p == string::npos ? pq : pq.substr (p + 1);
  }

  transfer::
  transfer (asio::io_context& ioc,
            const string& u,
            client_type::traits_type ct)
    : uri_ (parse_uri (u)),
      filename_ (derive_filename (uri_.path_and_query)),
      temp_dir_ (staging_directory ()),
      file_path_ (temp_dir_ / filename_),
      client_ (make_unique<client_type> (ioc, move (ct))),
      out_ (&cout)
  {
    ensure_directory (temp_dir_);
  }

  asio::awaitable<transfer::client_type::response_type> transfer::
  head ()
  {
    client_type::response_type r (co_await client_->head (uri_));

    if (!r.has_header ("Content-Length"))
      throw transfer_error (transfer_errc::missing_content_length,
                            "no Content-Length in HEAD response from " +
                            uri_.string ());

    co_return r;
  }

  asio::awaitable<string> transfer::
  content_length ()
  {
    client_type::response_type r (co_await head ());
    co_return *r.get_header ("Content-Length");
  }

  asio::awaitable<void> transfer::
  launch ()
  {
    // Find out how much we are about to get.
    //
    client_type::response_type h (co_await head ());
    optional<uint64_t> cl (h.content_length ());

    if (!cl)
      throw transfer_error (transfer_errc::missing_content_length,
                            "invalid Content-Length '" +
                            *h.get_header ("Content-Length") + "' from " +
                            uri_.string ());

    uint64_t total (*cl);

    client_type::stream_response_type r (co_await client_->get (uri_));

    if (!r.is_success ())
      throw transfer_error (transfer_errc::http_status,
                            "GET " + uri_.string () + ": " +
                            std::to_string (r.status_code ()) +
                            (r.reason.empty () ? "" : " " + r.reason));

    http_stream& s (**r.body);

    // Stream the body to disk as it arrives. Note that the file is
    // truncated on open so a leftover from an earlier run never survives.
    //
    staging_file f (file_path_);
    progress_indicator p (total, *out_);

    char b[8192];

    try
    {
      while (!s.done ())
      {
        size_t n (co_await s.read_some (b, sizeof (b)));

        if (n != 0)
        {
          f.write (b, n);
          p.set_position (f.written ());
        }
      }
    }
    catch (const boost::system::system_error& e)
    {
      throw transfer_error (transfer_errc::body_drain,
                            "unable to read body of " + uri_.string () +
                            ": " + e.code ().message ());
    }

    s.close ();
    f.close ();

    // What counts is what made it to disk.
    //
    uint64_t n (file_length (file_path_));

    p.set_position (n);
    p.finish ();

    if (n < total)
      throw transfer_error (transfer_errc::body_drain,
                            "short body from " + uri_.string () + ": got " +
                            std::to_string (n) + " of " +
                            std::to_string (total) + " bytes");
  }

  asio::awaitable<install_result> transfer::
  install ()
  {
    install_result r (co_await installer_.install (temp_dir_, filename_));

    *out_ << r << flush;

    co_return r;
  }
}
