#pragma once

#include <string>
#include <cstdint>
#include <fstream>
#include <filesystem>
#include <string_view>

namespace archeon
{
  namespace fs = std::filesystem;

  // Name of our directory under the system temp root.
  //
  inline constexpr const char staging_name[] = "archeon";

  // Return <system temp root>/archeon. Does not touch the filesystem beyond
  // asking where the temp root is (which honors TMPDIR).
  //
  fs::path
  staging_directory ();

  // Create the directory along with any missing parents. Idempotent.
  //
  // Throw transfer_error (staging_dir) if it cannot be created or if
  // something other than a directory is in the way.
  //
  void
  ensure_directory (const fs::path&);

  // Create or truncate the file and write all bytes to it.
  //
  void
  write_all (const fs::path&, std::string_view bytes);

  // Current size of the file on disk.
  //
  std::uint64_t
  file_length (const fs::path&);

  // Output file in the staging directory.
  //
  // Opening truncates, so a stale file from an earlier run never leaves
  // garbage at the end. All failures are reported as transfer_error
  // (file_io).
  //
  class staging_file
  {
  public:
    explicit
    staging_file (fs::path);

    staging_file (const staging_file&) = delete;
    staging_file& operator= (const staging_file&) = delete;

    void
    write (const char* data, std::size_t size);

    // Flush and close. Must be called to observe write errors that only
    // surface on flush; the destructor closes silently.
    //
    void
    close ();

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

    std::uint64_t
    written () const noexcept
    {
      return written_;
    }

  private:
    fs::path path_;
    std::ofstream ofs_;
    std::uint64_t written_ = 0;
  };
}
