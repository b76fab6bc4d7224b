#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace assist
{
  namespace fs = std::filesystem;

  // Per-user locations the installer reads or writes.
  //
  struct platform_paths
  {
    fs::path home;
    fs::path claude_dir;          // ~/.claude
    fs::path bin_dir;             // ~/.claude/bin
    fs::path download_dir;        // ~/.claude/downloads
    fs::path editor_settings_dir; // VS Code user settings directory.
    fs::path certs_dir;           // Where bundled certificates are dropped.
  };

  // Derive the paths from the home directory. The Windows editor settings
  // live under %APPDATA% which defaults to <home>/AppData/Roaming.
  //
  platform_paths
  windows_paths (const fs::path& home,
                 const std::optional<fs::path>& appdata = std::nullopt);

  platform_paths
  macos_paths (const fs::path& home);

  platform_paths
  linux_paths (const fs::path& home);

  // Persistent user environment changes.
  //
  // A value type: every modifier returns a new snapshot and leaves this one
  // alone. Writers receive the complete desired state and decide what
  // actually needs changing.
  //
  class environment_snapshot
  {
  public:
    using variable_map = std::map<std::string, std::string>;

    environment_snapshot () = default;

    environment_snapshot
    with_variable (const std::string& name, const std::string& value) const;

    // Add a directory to PATH. Adding the same directory twice is a no-op.
    //
    environment_snapshot
    with_path_entry (const fs::path&) const;

    const variable_map&
    variables () const noexcept
    {
      return variables_;
    }

    const std::vector<fs::path>&
    path_entries () const noexcept
    {
      return path_entries_;
    }

    bool
    empty () const noexcept
    {
      return variables_.empty () && path_entries_.empty ();
    }

  private:
    variable_map variables_;
    std::vector<fs::path> path_entries_;
  };

  struct environment_entry
  {
    std::string name;  // Variable name or PATH.
    std::string value;

    // What was done or, for pending entries, what the user should do.
    //
    std::string message;
  };

  struct environment_result
  {
    std::vector<environment_entry> applied;
    std::vector<environment_entry> unchanged;
    std::vector<environment_entry> pending;
  };

  // Persists environment snapshots for the current user.
  //
  class environment_writer
  {
  public:
    virtual
    ~environment_writer () = default;

    // Throw std::runtime_error if the store cannot be accessed at all.
    //
    virtual environment_result
    apply (const environment_snapshot&) = 0;
  };

  // Shell profiles are left alone: every entry is reported as pending
  // together with the line to add.
  //
  class posix_environment_writer: public environment_writer
  {
  public:
    environment_result
    apply (const environment_snapshot&) override;
  };

  // Host operating system capabilities, selected once at startup.
  //
  class platform_services
  {
  public:
    virtual
    ~platform_services () = default;

    // Human-readable name, for example macOS.
    //
    virtual std::string
    name () const = 0;

    // Whether this is a platform the installer is officially built for.
    //
    virtual bool
    supported () const = 0;

    // Manifest key, for example darwin-arm64.
    //
    virtual std::string
    platform_key () const = 0;

    virtual std::string
    binary_name () const = 0;

    virtual const platform_paths&
    paths () const = 0;

    // Directory name for this platform in the configuration bundle, for
    // example MACOS.
    //
    virtual std::string
    bundle_name () const = 0;

    // Editor settings file in the bundle's USER-DIRECTORY, mirroring where
    // it lives relative to the home directory.
    //
    virtual fs::path
    bundle_editor_settings () const = 0;

    // Well-known editor installation paths.
    //
    virtual std::vector<fs::path>
    editor_locations () const = 0;

    virtual void
    print_install_instructions (std::ostream&) const = 0;

    virtual environment_writer&
    environment () = 0;

    // <local>/<bundle name>/USER-DIRECTORY
    //
    fs::path
    bundle_config_dir (const fs::path& local) const
    {
      return local / bundle_name () / "USER-DIRECTORY";
    }
  };

  std::unique_ptr<platform_services>
  make_platform_services ();

  // Manifest key and binary name of the host we were built for.
  //
  std::string
  current_platform_key ();

  std::string
  current_binary_name ();

  // Home directory of the current user. Throw std::runtime_error if it
  // cannot be determined.
  //
  fs::path
  home_directory ();

  // Path of the running executable, falling back to the current directory.
  //
  fs::path
  current_executable_path ();
}
