#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include <boost/asio.hpp>

#include <assist/assist-http.hxx>

namespace assist
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Remote distribution endpoint.
  //
  // Serves the layout below a base URL:
  //
  //   <base>/latest
  //   <base>/<version>/manifest.json
  //   <base>/<version>/<platform>/<binary>
  //
  // Any failure (resolution, connection, TLS, non-2xx status) is thrown
  // as is; deciding whether to fall back is the caller's business.
  //
  class remote_store
  {
  public:
    using progress_callback = http_coordinator::progress_callback;

    remote_store (http_coordinator& http, std::string base_url);

    const std::string&
    base_url () const noexcept
    {
      return base_;
    }

    std::string
    url (const std::string& relative) const;

    asio::awaitable<std::string>
    fetch_text (const std::string& relative);

    asio::awaitable<void>
    fetch_file (const std::string& relative,
                const fs::path& target,
                progress_callback progress = nullptr);

  private:
    http_coordinator& http_;
    std::string base_;
  };

  // Local fallback store.
  //
  // A directory bundled with the installer that mirrors the remote layout
  // for offline and air-gapped installs.
  //
  class local_store
  {
  public:
    explicit
    local_store (fs::path root);

    const fs::path&
    root () const noexcept
    {
      return root_;
    }

    fs::path
    path (const std::string& relative) const;

    bool
    contains (const std::string& relative) const;

    // Throw std::runtime_error if the file is missing or unreadable.
    //
    std::string
    read_text (const std::string& relative) const;

    // Copy, overwriting the target. Throw std::runtime_error on failure.
    //
    void
    copy_file (const std::string& relative, const fs::path& target) const;

  private:
    fs::path root_;
  };

  // Locate the fallback store: <exe dir>/local if it exists, otherwise
  // <cwd>/local (which may not exist; the store then simply has nothing).
  //
  fs::path
  default_local_root (const fs::path& executable);
}
