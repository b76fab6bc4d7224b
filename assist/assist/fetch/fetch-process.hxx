#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <boost/asio.hpp>

namespace assist
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Run a program with inherited standard streams.
  //
  // While the child runs, SIGINT and SIGTERM delivered to us are forwarded
  // to it instead of terminating us, so that the caller gets to clean up
  // after the child exits. On Windows the console already delivers Ctrl-C
  // to the whole process group so nothing is forwarded there.
  //
  class process_runner
  {
  public:
    explicit
    process_runner (asio::io_context& ioc)
      : ioc_ (ioc) {}

    // Return the exit code (the signal number if the child was killed).
    // Throw std::runtime_error if the program cannot be started.
    //
    asio::awaitable<int>
    run (const fs::path& program, const std::vector<std::string>& args);

  private:
    asio::io_context& ioc_;
  };

  // Add the execute permission bits. No-op on Windows.
  //
  // Throw std::system_error on failure.
  //
  void
  make_executable (const fs::path&);
}
