#include <archeon/installer.hxx>

#include <cassert>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iostream>

#include <unistd.h> // getpid()

#include <boost/process/search_path.hpp>

#include <archeon/staging.hxx>
#include <archeon/transfer-error.hxx>

using namespace std;
using namespace archeon;

// Stand-in for dpkg that records where and how it was run.
//
static fs::path
fake_dpkg (const fs::path& dir)
{
  fs::path p (dir / "fake-dpkg");

  write_all (p,
             "#!/bin/sh\n"
             "pwd -P > invocation\n"
             "for a in \"$@\"; do echo \"$a\" >> invocation; done\n"
             "echo \"Selecting previously unselected package.\"\n"
             "echo \"dpkg: warning: not really\" >&2\n"
             "exit 3\n");

  fs::permissions (p,
                   fs::perms::owner_all |
                   fs::perms::group_read | fs::perms::group_exec |
                   fs::perms::others_read | fs::perms::others_exec,
                   fs::perm_options::replace);

  return p;
}

static vector<string>
read_lines (const fs::path& p)
{
  vector<string> r;
  ifstream ifs (p);
  for (string l; getline (ifs, l); )
    r.push_back (l);
  return r;
}

// The file is passed as is and resolved against the working directory.
//
static void
test_run (const fs::path& root)
{
  fs::path w (root / "work");
  ensure_directory (w);

  installer i (fake_dpkg (root).string ());
  install_result r (i.run (w, "test_launch_file.txt"));

  assert (r.exit_code == 3);
  assert (!r.success ());
  assert (r.out == "Selecting previously unselected package.\n");
  assert (r.err == "dpkg: warning: not really\n");

  vector<string> v (read_lines (w / "invocation"));
  assert (v.size () == 3);
  assert (v[0] == fs::canonical (w).string ());
  assert (v[1] == "--install");
  assert (v[2] == "test_launch_file.txt");

  ostringstream o;
  o << r;
  assert (o.str () == "exit status: 3\n"
                      "stdout:\n"
                      "Selecting previously unselected package.\n"
                      "stderr:\n"
                      "dpkg: warning: not really\n");
}

static void
test_spawn_fail (const fs::path& root)
{
  auto expect = [&root] (const string& prog)
  {
    bool thrown (false);
    try
    {
      installer (prog).run (root, "x.deb");
    }
    catch (const transfer_error& e)
    {
      thrown = true;
      assert (e.code () == transfer_errc::install_spawn);
    }
    assert (thrown);
  };

  expect ("");
  expect ("archeon-no-such-installer");
  expect ((root / "no-such-installer").string ());
}

static void
test_default ()
{
  installer i;
  assert (i.program () == "dpkg");
}

// If there is a real dpkg around, it must at least start and refuse a
// package that does not exist.
//
static void
test_dpkg (const fs::path& root)
{
  if (boost::process::search_path ("dpkg").empty ())
  {
    cerr << "warning: dpkg not found in PATH, skipping" << endl;
    return;
  }

  installer i;
  assert (i.resolve ().is_absolute ());

  install_result r (i.run (root, "archeon-no-such-package.deb"));
  assert (r.exit_code != 0);
  assert (!r.err.empty ());
}

int
main ()
{
  fs::path root (fs::temp_directory_path () /
                 ("archeon-installer-test-" + to_string (getpid ())));

  fs::remove_all (root);
  ensure_directory (root);

  test_default ();
  test_run (root);
  test_spawn_fail (root);
  test_dpkg (root);

  fs::remove_all (root);
}
