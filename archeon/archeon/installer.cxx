#include <archeon/installer.hxx>

#include <future>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <archeon/transfer-error.hxx>

using namespace std;

namespace archeon
{
  namespace bp = boost::process;

  ostream&
  operator<< (ostream& o, const install_result& r)
  {
    o << "exit status: " << r.exit_code << '\n'
      << "stdout:"       << '\n' << r.out;

    if (!r.out.empty () && r.out.back () != '\n')
      o << '\n';

    o << "stderr:" << '\n' << r.err;

    if (!r.err.empty () && r.err.back () != '\n')
      o << '\n';

    return o;
  }

  installer::
  installer (string p)
    : program_ (move (p))
  {
  }

  fs::path installer::
  resolve () const
  {
    if (program_.empty ())
      throw transfer_error (transfer_errc::install_spawn,
                            "no installer program specified");

    if (program_.find ('/') != string::npos)
      return fs::path (program_);

    auto p (bp::search_path (program_));

    if (p.empty ())
      throw transfer_error (transfer_errc::install_spawn,
                            "unable to find " + program_ + " in PATH");

    return fs::path (p.string ());
  }

  install_result installer::
  run (const fs::path& d, const string& f) const
  {
    fs::path x (resolve ());

    // Drain stdout and stderr concurrently through the private context. If
    // we read them one after the other (or only after wait()), a chatty
    // child could fill one pipe and block forever.
    //
    boost::asio::io_context ios;
    future<string> out;
    future<string> err;

    install_result r;

    try
    {
      bp::child c (x.string (),
                   bp::args ({string ("--install"), f}),
                   bp::start_dir (d.string ()),
                   bp::std_in < bp::null,
                   bp::std_out > out,
                   bp::std_err > err,
                   ios);

      ios.run ();
      c.wait ();

      r.exit_code = c.exit_code ();
    }
    catch (const bp::process_error& e)
    {
      throw transfer_error (transfer_errc::install_spawn,
                            "unable to run " + x.string () + ": " +
                            e.what ());
    }

    r.out = out.get ();
    r.err = err.get ();

    return r;
  }

  asio::awaitable<install_result> installer::
  install (const fs::path& d, const string& f) const
  {
    // Note that this blocks the calling thread until the installer exits.
    // That's fine for a tool that has nothing else to do in the meantime.
    //
    co_return run (d, f);
  }
}
