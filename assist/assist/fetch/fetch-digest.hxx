#pragma once

#include <filesystem>
#include <string>

namespace assist
{
  namespace fs = std::filesystem;

  // Compute the lower-case hex SHA-256 digest of a file.
  //
  // Throw std::runtime_error if the file cannot be read or OpenSSL fails.
  //
  std::string
  sha256_file (const fs::path&);

  // Same for an in-memory buffer.
  //
  std::string
  sha256_string (const std::string&);

  // Compare hex digests ignoring case. Digests of different length never
  // compare equal.
  //
  bool
  compare_digests (const std::string&, const std::string&) noexcept;
}
