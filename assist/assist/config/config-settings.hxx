#pragma once

#include <filesystem>
#include <string>

#include <boost/json.hpp>

namespace assist
{
  namespace fs = std::filesystem;

  // JSON settings files (~/.claude/settings.json, VS Code settings.json).
  //
  // VS Code settings routinely contain comments and trailing commas, so
  // both are accepted on input. They are not preserved on output.
  //

  // Throw std::runtime_error if the file cannot be read or does not hold a
  // JSON object.
  //
  boost::json::object
  read_settings (const fs::path&);

  boost::json::object
  parse_settings (const std::string& text, const std::string& origin);

  // Shallow merge: top-level members of source replace those in target,
  // everything else in target is kept.
  //
  boost::json::object
  merge_settings (boost::json::object target, const boost::json::object& source);

  // Two-space indented JSON followed by a newline.
  //
  std::string
  format_settings (const boost::json::value&);

  // Throw std::runtime_error on failure.
  //
  void
  write_settings (const fs::path&, const boost::json::object&);

  enum class deploy_action
  {
    copied, // Target did not exist.
    merged, // Merged into an existing target.
    skipped // Nothing to deploy.
  };

  std::string
  to_string (deploy_action);

  // Copy source to target if target does not exist yet, otherwise merge
  // source into it. Parent directories are created as needed.
  //
  deploy_action
  deploy_settings (const fs::path& source, const fs::path& target);
}
