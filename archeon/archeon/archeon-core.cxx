#include <archeon/archeon-core.hxx>

#include <stdexcept>

using namespace std;

namespace archeon
{
  core::
  core (unique_ptr<transfer> t)
    : transfer_ (move (t))
  {
  }

  core core::
  ignite (asio::io_context& ioc, const string& u)
  {
    return core (make_unique<transfer> (ioc, u));
  }

  transfer& core::
  staged ()
  {
    if (transfer_ == nullptr)
      throw logic_error ("core is not ignited");

    return *transfer_;
  }
}
