#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio.hpp>

#include <assist/assist-http.hxx>
#include <assist/fetch/artifact-fetcher.hxx>

namespace assist
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  struct fetch_settings
  {
    std::string bucket;
    fs::path local_dir;
    fs::path download_dir;
    std::string platform;
    std::string binary;
    std::string ca_file;      // Empty for the system trust store.
    bool verbose = false;
    bool progress = true;     // Only honored if stdout is a terminal.
  };

  // Production wiring of the artifact fetcher: HTTP remote store, local
  // fallback directory, Boost.Process runner, and console reporting.
  //
  class fetch_coordinator
  {
  public:
    fetch_coordinator (asio::io_context&, fetch_settings);
    ~fetch_coordinator ();

    fetch_coordinator (const fetch_coordinator&) = delete;
    fetch_coordinator& operator= (const fetch_coordinator&) = delete;

    const fetch_settings&
    settings () const noexcept
    {
      return settings_;
    }

    process_runner&
    runner () noexcept
    {
      return runner_;
    }

    // Run the pipeline for the target, printing each step. Throw
    // fetch_error.
    //
    asio::awaitable<install_outcome>
    install (const install_target&);

  private:
    struct reporter;

    fetch_settings settings_;
    http_coordinator http_;
    remote_store remote_;
    local_store local_;
    process_runner runner_;
    artifact_fetcher fetcher_;
    std::unique_ptr<reporter> reporter_;
  };

  // Whether standard output is attached to a terminal.
  //
  bool
  stdout_terminal () noexcept;
}
