#include <assist/tool/claude-code.hxx>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <assist/config/config-deployer.hxx>

using namespace std;

namespace assist
{
  claude_code::
  claude_code (platform_services& p,
               fetch_coordinator& f,
               fs::path l,
               bool c)
    : platform_ (p), fetch_ (f), local_ (move (l)), configure_ (c)
  {
  }

  fs::path claude_code::
  binary_path () const
  {
    return platform_.paths ().bin_dir / platform_.binary_name ();
  }

  bool claude_code::
  installed () const
  {
    error_code ec;
    return fs::exists (binary_path (), ec);
  }

  asio::awaitable<void> claude_code::
  install (const install_target& t)
  {
    cout << "Installing " << display_name () << " (" << t.text << ")"
         << endl;

    install_outcome o (co_await fetch_.install (t));

    cout << display_name () << ' ' << o.version.value << " installed"
         << endl;

    if (fetch_.settings ().verbose)
    {
      cout << "  version from " << o.version.source << '\n'
           << "  manifest from " << o.manifest_source << '\n'
           << "  binary from " << o.binary_source << endl;
    }

    // The installer already succeeded so configuration problems are not
    // fatal from here on.
    //
    if (configure_)
    {
      try
      {
        configure ();
      }
      catch (const exception& e)
      {
        cerr << "warning: unable to deploy configuration: " << e.what ()
             << endl;
      }
    }

    try
    {
      environment_snapshot s (
        environment_snapshot ().with_path_entry (platform_.paths ().bin_dir));

      print_environment (cout, platform_.environment ().apply (s));
    }
    catch (const exception& e)
    {
      cerr << "warning: unable to update PATH: " << e.what () << endl;
    }
  }

  asio::awaitable<void> claude_code::
  uninstall ()
  {
    if (!installed ())
    {
      cout << display_name () << " is not installed" << endl;
      co_return;
    }

    fs::path b (binary_path ());
    cout << "Uninstalling " << display_name () << endl;

    int r (-1);
    try
    {
      r = co_await fetch_.runner ().run (b, {"uninstall"});
    }
    catch (const exception& e)
    {
      cerr << "warning: " << e.what () << endl;
    }

    if (r == 0)
    {
      cout << display_name () << " uninstalled" << endl;
      co_return;
    }

    if (r > 0)
      cerr << "warning: " << b.string () << " uninstall exited with code "
           << r << endl;

    cout << "Removing " << display_name () << " manually" << endl;
    remove_manually ();
    cout << display_name () << " uninstalled" << endl;
  }

  void claude_code::
  remove_manually ()
  {
    fs::path b (binary_path ());
    const fs::path& d (platform_.paths ().bin_dir);

    error_code ec;
    fs::remove (b, ec);
    if (ec)
      throw runtime_error ("unable to remove " + b.string () + ": " +
                           ec.message ());

    fs::remove_all (d, ec);
    if (ec)
      throw runtime_error ("unable to remove " + d.string () + ": " +
                           ec.message ());
  }

  void claude_code::
  configure ()
  {
    fs::path b (platform_.bundle_config_dir (local_));

    cout << "Deploying " << platform_.name () << " configuration" << endl;

    config_deployer d (platform_.paths (),
                       b,
                       platform_.bundle_editor_settings (),
                       platform_.environment ());

    deploy_report r (d.deploy ());

    if (!r.bundle_found)
    {
      cerr << "warning: No platform-specific configs found in "
           << b.string () << endl;
      return;
    }

    for (const deploy_item& i : r.items)
    {
      cout << "  " << to_string (i.action) << ' ' << i.what;

      if (i.action != deploy_action::skipped)
        cout << " to " << i.target.string ();

      cout << endl;
    }

    for (const string& c : r.certificates)
      cout << "  deployed certificate " << c << endl;

    print_environment (cout, r.environment);
  }

  void
  print_environment (ostream& o, const environment_result& r)
  {
    for (const environment_entry& e : r.applied)
      o << "  " << e.message << endl;

    if (!r.pending.empty ())
    {
      o << "Add the following to your shell profile:" << endl;

      for (const environment_entry& e : r.pending)
        o << "  " << e.message << endl;
    }
  }
}
