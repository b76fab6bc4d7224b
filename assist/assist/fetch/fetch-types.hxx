#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace assist
{
  namespace fs = std::filesystem;

  // Semantic version as published in the release bucket.
  //
  // Format: <major>.<minor>.<patch>[-<pre-release>]
  //
  // Where <pre-release> is one or more dot-separated identifiers made of
  // [0-9A-Za-z-]. Build metadata (+...) is not used by the distribution and
  // is rejected.
  //
  struct semantic_version
  {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;

    // Without the leading '-'. Empty for a final release.
    //
    std::string pre_release;

    bool
    release () const noexcept
    {
      return pre_release.empty ();
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& os, const semantic_version& v)
  {
    return os << v.string ();
  }

  // Return nullopt if the string is not a valid version. Surrounding
  // whitespace is not allowed here; trim before calling.
  //
  std::optional<semantic_version>
  parse_semantic_version (const std::string&);

  // Release channel with a pointer file in the distribution.
  //
  enum class release_channel
  {
    latest,
    stable
  };

  std::string
  to_string (release_channel);

  inline std::ostream&
  operator<< (std::ostream& os, release_channel c)
  {
    return os << to_string (c);
  }

  // Install target as requested on the command line: either a symbolic
  // channel or a concrete version. The original text is kept since that
  // is what gets passed on to the downloaded installer.
  //
  struct install_target
  {
    std::string text;
    std::optional<release_channel> channel;
    std::optional<semantic_version> version;

    bool
    concrete () const noexcept
    {
      return version.has_value ();
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const install_target& t)
  {
    return os << t.text;
  }

  // Return nullopt unless the string is `latest`, `stable`, or a semantic
  // version.
  //
  std::optional<install_target>
  parse_install_target (const std::string&);

  // Where a fetch stage got its data from. A concrete version requested
  // by the user comes from neither store.
  //
  enum class artifact_source
  {
    requested,
    remote,
    local_fallback
  };

  std::string
  to_string (artifact_source);

  inline std::ostream&
  operator<< (std::ostream& os, artifact_source s)
  {
    return os << to_string (s);
  }

  // Pipeline state. Every state other than done may transition to failed.
  //
  enum class fetch_state
  {
    idle,
    resolving_version,
    fetching_manifest,
    selecting_platform,
    downloading,
    verifying,
    installing,
    cleanup,
    done,
    failed
  };

  std::string
  to_string (fetch_state);

  inline std::ostream&
  operator<< (std::ostream& os, fetch_state s)
  {
    return os << to_string (s);
  }

  struct resolved_version
  {
    std::string value;
    artifact_source source;
  };

  // Downloaded binary whose digest matched the manifest.
  //
  struct verified_artifact
  {
    fs::path path;
    std::string checksum;
    artifact_source source;
  };

  // Relative paths within the distribution layout, shared by the remote
  // bucket and the local fallback store.
  //
  std::string
  pointer_path (release_channel);

  std::string
  manifest_path (const std::string& version);

  std::string
  binary_path (const std::string& version,
               const std::string& platform,
               const std::string& binary);

  // Name of the downloaded artifact in the download cache, unique per
  // version and platform. For example, claude-1.2.3-darwin-arm64 or
  // claude-1.2.3-win32-x64.exe.
  //
  std::string
  artifact_file_name (const std::string& version,
                      const std::string& platform,
                      const std::string& binary);

  // Fatal pipeline error. Carries the stage it happened in.
  //
  class fetch_error: public std::runtime_error
  {
  public:
    fetch_error (fetch_state stage, const std::string& what)
      : std::runtime_error (what), stage_ (stage) {}

    fetch_state
    stage () const noexcept
    {
      return stage_;
    }

  private:
    fetch_state stage_;
  };

  // Version pointer unavailable both remotely and locally.
  //
  class resolution_error: public fetch_error
  {
  public:
    explicit
    resolution_error (const std::string& what)
      : fetch_error (fetch_state::resolving_version, what) {}
  };

  // Manifest unavailable or malformed.
  //
  class manifest_error: public fetch_error
  {
  public:
    explicit
    manifest_error (const std::string& what)
      : fetch_error (fetch_state::fetching_manifest, what) {}
  };

  class unsupported_platform_error: public fetch_error
  {
  public:
    explicit
    unsupported_platform_error (const std::string& platform)
      : fetch_error (fetch_state::selecting_platform,
                     "platform " + platform + " is not in the release manifest"),
        platform_ (platform) {}

    const std::string&
    platform () const noexcept
    {
      return platform_;
    }

  private:
    std::string platform_;
  };

  // Binary unavailable from both sources.
  //
  class download_error: public fetch_error
  {
  public:
    explicit
    download_error (const std::string& what)
      : fetch_error (fetch_state::downloading, what) {}
  };

  // Never retried: the file may have been tampered with.
  //
  class checksum_mismatch_error: public fetch_error
  {
  public:
    checksum_mismatch_error (const std::string& what,
                             std::string expected,
                             std::string actual)
      : fetch_error (fetch_state::verifying, what),
        expected_ (std::move (expected)),
        actual_ (std::move (actual)) {}

    const std::string&
    expected () const noexcept
    {
      return expected_;
    }

    const std::string&
    actual () const noexcept
    {
      return actual_;
    }

  private:
    std::string expected_;
    std::string actual_;
  };

  // The downloaded installer ran but exited non-zero (or could not be
  // started, in which case the exit code is -1).
  //
  class installer_subprocess_error: public fetch_error
  {
  public:
    installer_subprocess_error (const std::string& what, int exit_code)
      : fetch_error (fetch_state::installing, what),
        exit_code_ (exit_code) {}

    int
    exit_code () const noexcept
    {
      return exit_code_;
    }

  private:
    int exit_code_;
  };
}
