#include <assist/fetch/fetch-process.hxx>

#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <boost/process.hpp>

#ifndef _WIN32
#  include <signal.h>
#  include <sys/types.h>
#endif

using namespace std;

namespace assist
{
  namespace bp = boost::process;

  // Running child together with the signals forwarded to it. Pending
  // handlers share ownership so that it outlives the run () call that
  // started it.
  //
  struct child_watch
  {
    bp::child child;
    asio::signal_set signals;
    bool active = true;

    child_watch (asio::io_context& ioc,
                 const fs::path& p,
                 const vector<string>& as)
      : child (bp::exe (p.string ()), bp::args (as)),
        signals (ioc, SIGINT, SIGTERM) {}
  };

  // Keep forwarding until the watch is deactivated.
  //
  static void
  forward_signals (const shared_ptr<child_watch>& w)
  {
    w->signals.async_wait (
      [w] (const boost::system::error_code& ec, int n)
      {
        if (ec || !w->active)
          return;

#ifndef _WIN32
        std::error_code e;
        if (w->child.valid () && w->child.running (e))
          ::kill (w->child.id (), n);
#else
        (void) n;
#endif

        forward_signals (w);
      });
  }

  asio::awaitable<int> process_runner::
  run (const fs::path& p, const vector<string>& as)
  {
    shared_ptr<child_watch> w;

    try
    {
      w = make_shared<child_watch> (ioc_, p, as);
    }
    catch (const bp::process_error& e)
    {
      throw runtime_error ("unable to start " + p.string () + ": " +
                           e.what ());
    }

    forward_signals (w);

    // Boost.Process v1 has no awaitable wait so poll, keeping the io
    // context free to deliver the signals above.
    //
    asio::steady_timer t (ioc_);
    std::error_code ec;

    while (w->child.running (ec))
    {
      t.expires_after (chrono::milliseconds (50));
      co_await t.async_wait (asio::use_awaitable);
    }

    // A signal completion may already be queued, so deactivate before
    // cancelling.
    //
    w->active = false;

    boost::system::error_code ie;
    w->signals.cancel (ie);

    if (ec)
      throw runtime_error ("unable to wait for " + p.string () + ": " +
                           ec.message ());

    co_return w->child.exit_code ();
  }

  void
  make_executable (const fs::path& p)
  {
#ifndef _WIN32
    fs::permissions (p,
                     fs::perms::owner_all |
                     fs::perms::group_read | fs::perms::group_exec |
                     fs::perms::others_read | fs::perms::others_exec,
                     fs::perm_options::replace);
#else
    (void) p;
#endif
  }
}
