#include <string>
#include <iostream>
#include <exception>

#include <boost/asio/io_context.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/awaitable.hpp>

#include <archeon/version.hxx>
#include <archeon/archeon-core.hxx>
#include <archeon/archeon-options.hxx>

using namespace std;

namespace archeon
{
  // Fetch and install. Return the installer's exit code.
  //
  static asio::awaitable<int>
  run (asio::io_context& ioc, const string& url, bool verbose)
  {
    core c (core::ignite (ioc, url));
    transfer& t (c.staged ());

    if (verbose)
      cerr << "info: staging " << t.uri () << " as " << t.file_path ()
           << endl;

    co_await t.launch ();

    if (verbose)
      cerr << "info: installing " << t.filename () << " from "
           << t.temp_dir () << endl;

    install_result r (co_await t.install ());

    if (verbose)
      cerr << "info: installer exited with status " << r.exit_code << endl;

    co_return r.exit_code;
  }
}

int
main (int argc, char* argv[])
{
  using namespace archeon;

  try
  {
    // Options come first and parsing stops at the URL.
    //
    cli::argv_scanner scan (argc, argv);
    options opt (scan);

    if (opt.version ())
    {
      cout << "archeon " << ARCHEON_VERSION_ID << "\n";
      return 0;
    }

    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: archeon [options] <url>" << "\n"
        << "options:"                       << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (!scan.more ())
    {
      cerr << "error: package URL expected" << "\n"
           << "  info: run 'archeon --help' for more information" << "\n";
      return 1;
    }

    string url (scan.next ());

    if (scan.more ())
    {
      cerr << "error: unexpected argument '" << scan.next () << "'" << "\n";
      return 1;
    }

    asio::io_context ioc;
    int exit_code (1);

    asio::co_spawn (
      ioc,
      run (ioc, url, opt.verbose ()),
      [&exit_code, &ioc] (exception_ptr ex, int r)
      {
        exit_code = r;
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            exit_code = 1;
          }
        }
        ioc.stop ();
      });

    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
