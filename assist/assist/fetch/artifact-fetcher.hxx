#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include <boost/asio/awaitable.hpp>

#include <assist/fetch/fetch-types.hxx>
#include <assist/fetch/fetch-manifest.hxx>
#include <assist/fetch/fetch-store.hxx>
#include <assist/fetch/fetch-process.hxx>

namespace assist
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  // Both stores and the runner are borrowed. A remote store provides
  // fetch_text() and fetch_file(), a local store read_text() and
  // copy_file(), and a runner run(); see fetch-store.hxx and
  // fetch-process.hxx for the production ones.
  //
  template <typename R = remote_store,
            typename L = local_store,
            typename P = process_runner>
  struct artifact_fetcher_traits
  {
    using remote_type = R;
    using local_type = L;
    using runner_type = P;

    // Positional argument the downloaded binary is invoked with, followed
    // by the install target as requested by the user.
    //
    static constexpr const char* install_command = "install";
  };

  struct fetched_manifest
  {
    release_manifest manifest;
    artifact_source source;
  };

  struct install_outcome
  {
    resolved_version version;
    artifact_source manifest_source;
    artifact_source binary_source;
    int exit_code = 0;
  };

  // Versioned artifact fetcher.
  //
  // Resolves an install target to a concrete version, fetches and checks the
  // release manifest, downloads and verifies the platform binary, and hands
  // over to it. Every fetch tries the remote store first and falls back to
  // the local one exactly once; nothing is retried. Every error thrown is a
  // fetch_error naming the stage, with the underlying causes nested.
  //
  template <typename T = artifact_fetcher_traits<>>
  class basic_artifact_fetcher
  {
  public:
    using traits = T;
    using remote_type = typename traits::remote_type;
    using local_type = typename traits::local_type;
    using runner_type = typename traits::runner_type;

    using state_callback = std::function<void (fetch_state)>;

    using progress_callback =
      std::function<void (std::uint64_t bytes, std::uint64_t total)>;

    // Called with the stage and the remote failure right before falling
    // back to the local store.
    //
    using fallback_callback =
      std::function<void (fetch_state, const std::string& cause)>;

    using warning_callback = std::function<void (const std::string&)>;

    basic_artifact_fetcher (remote_type& remote,
                            local_type& local,
                            runner_type& runner,
                            fs::path download_dir);

    basic_artifact_fetcher (const basic_artifact_fetcher&) = delete;
    basic_artifact_fetcher& operator= (const basic_artifact_fetcher&) = delete;

    void
    on_state (state_callback cb)
    {
      state_cb_ = std::move (cb);
    }

    void
    on_progress (progress_callback cb)
    {
      progress_cb_ = std::move (cb);
    }

    void
    on_fallback (fallback_callback cb)
    {
      fallback_cb_ = std::move (cb);
    }

    void
    on_warning (warning_callback cb)
    {
      warning_cb_ = std::move (cb);
    }

    fetch_state
    state () const noexcept
    {
      return state_;
    }

    const fs::path&
    download_directory () const noexcept
    {
      return download_dir_;
    }

    // Pipeline stages.
    //

    // A concrete version is returned as is without touching either store.
    // A channel is looked up via its pointer file whose (trimmed) content
    // must be a semantic version.
    //
    // Throw resolution_error.
    //
    asio::awaitable<resolved_version>
    resolve_version (const install_target&);

    // A manifest that was fetched but does not parse is a manifest_error
    // right away; only an unreachable manifest falls back.
    //
    // Throw manifest_error.
    //
    asio::awaitable<fetched_manifest>
    fetch_manifest (const resolved_version&);

    // Throw unsupported_platform_error, or manifest_error if the entry is
    // malformed.
    //
    checksum_entry
    select_platform_entry (const release_manifest&, const std::string& platform);

    // Download into the download directory and verify the size (if the
    // entry has one) and SHA-256 digest. On any failure no file is left
    // behind. A mismatch is fatal even if the local store has a copy.
    //
    // Throw download_error or checksum_mismatch_error.
    //
    asio::awaitable<verified_artifact>
    download_and_verify (const resolved_version&,
                         const std::string& platform,
                         const std::string& binary,
                         const checksum_entry&);

    // Run `<artifact> install <target>` and return its exit code. The
    // artifact is removed whatever happens; failing to remove it is only a
    // warning.
    //
    // Throw installer_subprocess_error if the binary cannot be started.
    //
    asio::awaitable<int>
    run_installer (const verified_artifact&, const install_target&);

    // Run the whole pipeline, ending in the done or failed state.
    //
    // Throw fetch_error (installer_subprocess_error for a non-zero exit).
    //
    asio::awaitable<install_outcome>
    install (const install_target&,
             const std::string& platform,
             const std::string& binary);

  private:
    void
    transition (fetch_state);

    void
    fallback (fetch_state, const std::string& cause);

    void
    warn (const std::string&);

    void
    remove_partial (const fs::path&);

    remote_type& remote_;
    local_type& local_;
    runner_type& runner_;
    fs::path download_dir_;

    fetch_state state_ = fetch_state::idle;

    state_callback state_cb_;
    progress_callback progress_cb_;
    fallback_callback fallback_cb_;
    warning_callback warning_cb_;
  };

  using artifact_fetcher = basic_artifact_fetcher<>;
}

#include <assist/fetch/artifact-fetcher.txx>
