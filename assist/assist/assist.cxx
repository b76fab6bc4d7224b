#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <assist/assist-command.hxx>
#include <assist/assist-fetch.hxx>
#include <assist/assist-options.hxx>
#include <assist/assist-prerequisites.hxx>
#include <assist/fetch/fetch-store.hxx>
#include <assist/platform/platform.hxx>
#include <assist/tool/claude-code.hxx>
#include <assist/tool/tool-registry.hxx>

#include <assist/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace assist
{
  // Prompt the user for confirmation. An empty answer means yes.
  //
  static bool
  confirm_action (const string& prompt)
  {
    cout << prompt << " [Y/n] " << flush;

    string a;
    getline (cin, a);

    bool f (cin.fail ());

    if (f || cin.eof ())
      cout << endl;

    if (f)
      throw ios_base::failure ("unable to read y/n answer from stdin");

    a.erase (remove_if (a.begin (), a.end (),
                        [] (unsigned char c) {return isspace (c) != 0;}),
             a.end ());

    transform (a.begin (), a.end (), a.begin (),
               [] (unsigned char c) {return static_cast<char> (tolower (c));});

    return a.empty () || a == "y" || a == "yes";
  }

  // Options, positional arguments, and platform detection results in a
  // single unit.
  //
  struct runtime_context
  {
    string command;
    install_target target;
    string tool;
    bool yes;
    bool verbose;
    bool prerequisites;
    bool configure;
    fs::path local_dir;
    fetch_settings fetch;
  };

  static runtime_context
  make_context (const options& opt,
                const vector<string>& args,
                const platform_services& ps)
  {
    runtime_context r;

    command_line c (parse_command_line (args));
    r.command = move (c.command);
    r.target = move (c.target);

    r.tool = opt.tool ();
    r.yes = opt.yes ();
    r.verbose = opt.verbose ();
    r.prerequisites = !opt.skip_prerequisites ();
    r.configure = !opt.no_configure ();

    r.local_dir = opt.local_dir_specified ()
      ? fs::path (opt.local_dir ())
      : default_local_root (current_executable_path ());

    fetch_settings& f (r.fetch);
    f.bucket = opt.bucket ();
    f.local_dir = r.local_dir;
    f.download_dir = opt.download_dir_specified ()
      ? fs::path (opt.download_dir ())
      : ps.paths ().download_dir;

    if (opt.platform_specified ())
    {
      f.platform = opt.platform ();
      f.binary = f.platform.compare (0, 6, "win32-") == 0
        ? "claude.exe"
        : "claude";
    }
    else
    {
      f.platform = ps.platform_key ();
      f.binary = ps.binary_name ();
    }

    f.ca_file = opt.ca_file ();
    f.verbose = r.verbose;
    f.progress = !opt.no_progress ();

    return r;
  }

  // Drive the coroutine to completion, rethrowing its exception.
  //
  static void
  run_until_complete (asio::io_context& ioc, asio::awaitable<void> a)
  {
    exception_ptr ex;

    asio::co_spawn (
      ioc,
      move (a),
      [&ex, &ioc] (exception_ptr e)
      {
        ex = e;
        ioc.stop ();
      });

    ioc.restart ();
    ioc.run ();

    if (ex)
      rethrow_exception (ex);
  }

  // Print the nested causes, innermost last.
  //
  static void
  print_causes (const exception& e)
  {
    try
    {
      rethrow_if_nested (e);
    }
    catch (const exception& n)
    {
      cerr << "  info: " << n.what () << endl;
      print_causes (n);
    }
  }

  static int
  check (const platform_services& ps)
  {
    prerequisite_report r (check_prerequisites (ps));
    print_prerequisites (cout, r);

    if (!r.satisfied ())
    {
      ps.print_install_instructions (cout);
      return 1;
    }

    return 0;
  }

  static int
  execute (const runtime_context& ctx, platform_services& ps)
  {
    if (ctx.command == "check")
      return check (ps);

    asio::io_context ioc;
    fetch_coordinator fc (ioc, ctx.fetch);

    tool_registry reg;
    reg.add (make_unique<claude_code> (ps, fc, ctx.local_dir, ctx.configure));

    if (ctx.command == "list")
    {
      for (const auto& p : reg)
      {
        const tool& t (*p.second);

        cout << t.name () << " (" << t.display_name () << "): "
             << (t.installed () ? "installed" : "not installed") << endl;
      }

      return 0;
    }

    tool& t (reg.get (ctx.tool));

    if (ctx.command == "configure")
    {
      t.configure ();
      return 0;
    }

    if (ctx.command == "install")
    {
      if (ctx.prerequisites && check (ps) != 0)
        return 1;

      cout << "About to install " << t.display_name () << ' '
           << ctx.target.text << " for " << ctx.fetch.platform << endl;

      if (!ctx.yes && !confirm_action ("Continue?"))
      {
        cout << "Aborted." << endl;
        return 0;
      }

      run_until_complete (ioc, t.install (ctx.target));
      return 0;
    }

    // uninstall
    //
    cout << "About to uninstall " << t.display_name () << endl;

    if (!ctx.yes && !confirm_action ("Continue?"))
    {
      cout << "Aborted." << endl;
      return 0;
    }

    run_until_complete (ioc, t.uninstall ());
    return 0;
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace assist;

  bool verbose (false);

  try
  {
    // Leave the positional arguments (command and target) in argv.
    //
    options opt (argc,
                 argv,
                 true,
                 cli::unknown_mode::fail,
                 cli::unknown_mode::skip);

    verbose = opt.verbose ();

    if (opt.version ())
    {
      cout << "code-assist " << ASSIST_VERSION_ID << "\n";
      return 0;
    }

    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: code-assist [options] [<command> [<target>]]"     << "\n"
        << "       code-assist [options] <target>"                  << "\n"
        << "commands:"                                               << "\n"
        << "  install [<target>]  install latest, stable or <version>" << "\n"
        << "  uninstall           remove the tool"                   << "\n"
        << "  configure           deploy the configuration bundle"   << "\n"
        << "  check               check for the editor and Git"      << "\n"
        << "  list                list the known tools"              << "\n"
        << "options:"                                                << "\n";

      opt.print_usage (o);

      return 0;
    }

    unique_ptr<platform_services> ps (make_platform_services ());

    if (!ps->supported ())
      cerr << "warning: " << ps->name () << " is not officially supported"
           << endl;

    runtime_context ctx (
      make_context (opt, vector<string> (argv + 1, argv + argc), *ps));

    return execute (ctx, *ps);
  }
  catch (const fetch_error& e)
  {
    cerr << "error: " << e.stage () << ": " << e.what () << endl;

    if (verbose)
      print_causes (e);

    if (auto* x = dynamic_cast<const installer_subprocess_error*> (&e))
    {
      if (x->exit_code () > 0)
        return x->exit_code ();
    }

    return 1;
  }
  catch (const cli::exception& e)
  {
    cerr << "error: " << e.what () << "\n";
    return 1;
  }
  catch (const exception& e)
  {
    cerr << "error: " << e.what () << "\n";

    if (verbose)
      print_causes (e);

    return 1;
  }
}
