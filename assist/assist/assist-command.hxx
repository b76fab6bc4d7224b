#pragma once

#include <string>
#include <vector>

#include <assist/fetch/fetch-types.hxx>

namespace assist
{
  // Positional part of the command line.
  //
  //   [<command>] [<target>]
  //
  // Only install takes a target. A lone target is a shorthand for
  // install <target>.
  //
  struct command_line
  {
    std::string command;
    install_target target;
  };

  bool
  known_command (const std::string&) noexcept;

  // Throw std::invalid_argument for an unknown command, an unexpected
  // argument, or a target that is not latest, stable or a version.
  //
  command_line
  parse_command_line (const std::vector<std::string>& args);
}
