#pragma once

#include <assist/http/http-client.hxx>

#include <boost/asio.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace assist
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  class http_coordinator
  {
  public:
    using client_type = http_client;
    using response_type = http_response;

    using progress_callback =
      std::function<void (std::uint64_t bytes_transferred,
                          std::uint64_t total_bytes)>;

    explicit
    http_coordinator (asio::io_context& ioc);

    http_coordinator (asio::io_context& ioc,
                      const http_client_traits<>& traits);

    http_coordinator (const http_coordinator&) = delete;
    http_coordinator& operator= (const http_coordinator&) = delete;

    // GET request returning the body as string.
    //
    // Throws on network failure or non-2xx status.
    //
    asio::awaitable<std::string>
    get (const std::string& url);

    // Download to the specified path, creating parent directories.
    //
    // Throws on network failure or non-200 status. A partially written
    // file may be left behind on failure.
    //
    asio::awaitable<std::uint64_t>
    download_file (const std::string& url,
                   const fs::path& target,
                   progress_callback progress = nullptr);

  private:
    std::unique_ptr<client_type> client_;
  };

  // Create a descriptive error message from an HTTP response.
  //
  std::string
  format_http_error (const http_response&);
}
