#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <assist/config/config-settings.hxx>
#include <assist/platform/platform.hxx>

namespace assist
{
  namespace fs = std::filesystem;

  struct deploy_item
  {
    std::string what;  // For example, "Claude settings".
    fs::path target;
    deploy_action action;
  };

  struct deploy_report
  {
    // False if the bundle has nothing for this platform, in which case
    // nothing else was attempted.
    //
    bool bundle_found = false;

    std::vector<deploy_item> items;

    // Certificates copied, by file name.
    //
    std::vector<std::string> certificates;

    environment_result environment;
  };

  // Deploys the organization's configuration bundle for one platform:
  //
  // <bundle>/.claude/settings.json         -> ~/.claude/settings.json
  // <bundle>/{.continue/certs,certs}/*.crt -> certificates directory
  // <bundle>/<editor settings path>        -> editor settings.json
  // <bundle>/vscode-settings.json          -> editor settings.json
  //
  // Finally, points Node.js at the corporate root certificate, if one was
  // deployed, through the environment writer.
  //
  class config_deployer
  {
  public:
    // Certificate names recognized as the proxy root certificate, in order
    // of preference.
    //
    static const std::vector<std::string> root_certificates;

    config_deployer (const platform_paths& paths,
                     fs::path bundle_dir,
                     fs::path bundle_editor_settings,
                     environment_writer& writer);

    // Throw std::runtime_error on I/O or JSON errors.
    //
    deploy_report
    deploy ();

    // Add the environment the deployed files require to the snapshot.
    //
    environment_snapshot
    desired_environment (const environment_snapshot& base) const;

  private:
    deploy_item
    deploy_claude_settings ();

    std::vector<std::string>
    deploy_certificates ();

    deploy_item
    deploy_editor_settings ();

    const platform_paths& paths_;
    fs::path bundle_;
    fs::path editor_settings_;
    environment_writer& writer_;
  };
}
