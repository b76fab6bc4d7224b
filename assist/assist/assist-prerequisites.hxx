#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <assist/platform/platform.hxx>

namespace assist
{
  struct prerequisite_status
  {
    std::string name;
    bool installed;
  };

  struct prerequisite_report
  {
    std::vector<prerequisite_status> items;

    bool
    satisfied () const noexcept
    {
      for (const prerequisite_status& s : items)
      {
        if (!s.installed)
          return false;
      }

      return true;
    }
  };

  // Return true if the program is found on PATH and exits with 0 when run
  // with the arguments. Its output is discarded.
  //
  bool
  command_succeeds (const std::string& program,
                    const std::vector<std::string>& args);

  // VS Code (a known install location or `code --version`) and Git (`git
  // --version`).
  //
  prerequisite_report
  check_prerequisites (const platform_services&);

  void
  print_prerequisites (std::ostream&, const prerequisite_report&);
}
