#include <assist/assist-command.hxx>

#include <optional>
#include <stdexcept>

using namespace std;

namespace assist
{
  bool
  known_command (const string& c) noexcept
  {
    return c == "install"   ||
           c == "uninstall" ||
           c == "configure" ||
           c == "check"     ||
           c == "list";
  }

  command_line
  parse_command_line (const vector<string>& args)
  {
    command_line r;

    // Target that stands in for the command, if any.
    //
    optional<install_target> bare;

    if (args.empty ())
      r.command = "install";
    else if (known_command (args[0]))
      r.command = args[0];
    else if ((bare = parse_install_target (args[0])))
      r.command = "install";
    else
      throw invalid_argument ("unknown command '" + args[0] + "'");

    size_t n (bare ? 1 : r.command == "install" ? 2 : 1);
    if (args.size () > n)
      throw invalid_argument ("unexpected argument '" + args[n] + "'");

    if (bare)
    {
      r.target = move (*bare);
      return r;
    }

    string t (args.size () > 1 ? args[1] : "latest");

    if (optional<install_target> v = parse_install_target (t))
      r.target = move (*v);
    else
      throw invalid_argument ("invalid install target '" + t +
                              "': expected latest, stable or a version "
                              "such as 1.2.3");

    return r;
  }
}
