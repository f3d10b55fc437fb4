#include <archeon/staging.hxx>

#include <system_error>

#include <archeon/transfer-error.hxx>

using namespace std;

namespace archeon
{
  fs::path
  staging_directory ()
  {
    error_code ec;
    fs::path t (fs::temp_directory_path (ec));

    if (ec)
      throw transfer_error (transfer_errc::staging_dir,
                            "unable to determine temporary directory: " +
                            ec.message ());

    return t / staging_name;
  }

  void
  ensure_directory (const fs::path& d)
  {
    // Note that create_directories() returns false without an error if the
    // directory is already there, which is exactly the idempotency we want.
    // It does, however, fail if a non-directory is sitting at that path.
    //
    error_code ec;
    fs::create_directories (d, ec);

    if (ec)
      throw transfer_error (transfer_errc::staging_dir,
                            "unable to create directory " + d.string () +
                            ": " + ec.message ());

    if (!fs::is_directory (d, ec))
      throw transfer_error (transfer_errc::staging_dir,
                            d.string () + " is not a directory");
  }

  void
  write_all (const fs::path& p, string_view b)
  {
    staging_file f (p);
    f.write (b.data (), b.size ());
    f.close ();
  }

  uint64_t
  file_length (const fs::path& p)
  {
    error_code ec;
    uintmax_t n (fs::file_size (p, ec));

    if (ec)
      throw transfer_error (transfer_errc::file_io,
                            "unable to stat " + p.string () + ": " +
                            ec.message ());

    return static_cast<uint64_t> (n);
  }

  // staging_file
  //
  staging_file::
  staging_file (fs::path p)
    : path_ (move (p)),
      ofs_ (path_, ios::binary | ios::out | ios::trunc)
  {
    if (!ofs_)
      throw transfer_error (transfer_errc::file_io,
                            "unable to open " + path_.string () +
                            " for writing");
  }

  void staging_file::
  write (const char* d, size_t n)
  {
    ofs_.write (d, static_cast<streamsize> (n));

    if (!ofs_)
      throw transfer_error (transfer_errc::file_io,
                            "unable to write to " + path_.string ());

    written_ += n;
  }

  void staging_file::
  close ()
  {
    ofs_.close ();

    if (ofs_.fail ())
      throw transfer_error (transfer_errc::file_io,
                            "unable to close " + path_.string ());
  }
}
