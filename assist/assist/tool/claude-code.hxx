#pragma once

#include <filesystem>
#include <ostream>
#include <string>

#include <assist/assist-fetch.hxx>
#include <assist/platform/platform.hxx>
#include <assist/tool/tool.hxx>

namespace assist
{
  namespace fs = std::filesystem;

  // The Claude Code CLI, installed into ~/.claude/bin by its own installer
  // subcommand.
  //
  class claude_code: public tool
  {
  public:
    claude_code (platform_services& platform,
                 fetch_coordinator& fetch,
                 fs::path local_dir,
                 bool configure_after_install);

    std::string
    name () const override
    {
      return "claude-code";
    }

    std::string
    display_name () const override
    {
      return "Claude Code";
    }

    bool
    installed () const override;

    asio::awaitable<void>
    install (const install_target&) override;

    // Prefer the binary's own uninstaller and fall back to removing the
    // files ourselves.
    //
    asio::awaitable<void>
    uninstall () override;

    void
    configure () override;

    fs::path
    binary_path () const;

  private:
    void
    remove_manually ();

    platform_services& platform_;
    fetch_coordinator& fetch_;
    fs::path local_;
    bool configure_;
  };

  // Print what the environment writer did and what is left to the user.
  //
  void
  print_environment (std::ostream&, const environment_result&);
}
