#include <assist/assist-prerequisites.hxx>

#include <system_error>

#include <boost/process.hpp>

using namespace std;

namespace assist
{
  namespace bp = boost::process;

  bool
  command_succeeds (const string& program, const vector<string>& args)
  {
    auto p (bp::search_path (program));

#ifdef _WIN32
    // The VS Code command line is a batch file.
    //
    if (p.empty ())
      p = bp::search_path (program + ".cmd");
#endif

    if (p.empty ())
      return false;

    try
    {
      bp::child c (p,
                   bp::args (args),
                   bp::std_out > bp::null,
                   bp::std_err > bp::null,
                   bp::std_in < bp::null);
      c.wait ();
      return c.exit_code () == 0;
    }
    catch (const bp::process_error&)
    {
      // Found but not runnable counts as not installed.
      //
      return false;
    }
  }

  prerequisite_report
  check_prerequisites (const platform_services& ps)
  {
    prerequisite_report r;

    bool editor (false);
    for (const fs::path& p : ps.editor_locations ())
    {
      error_code ec;
      if (fs::exists (p, ec))
      {
        editor = true;
        break;
      }
    }

    if (!editor)
      editor = command_succeeds ("code", {"--version"});

    r.items.push_back ({"VS Code", editor});
    r.items.push_back ({"Git", command_succeeds ("git", {"--version"})});

    return r;
  }

  void
  print_prerequisites (ostream& o, const prerequisite_report& r)
  {
    for (const prerequisite_status& s : r.items)
    {
      if (s.installed)
        o << "  found " << s.name << '\n';
      else
        o << "  missing " << s.name << " (not installed)" << '\n';
    }

    o << flush;
  }
}
