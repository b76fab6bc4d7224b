#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <boost/json/value.hpp>

#include <assist/fetch/fetch-types.hxx>

namespace assist
{
  // Per-platform manifest record.
  //
  struct checksum_entry
  {
    std::string platform;

    // Lower-case hex SHA-256 of the binary.
    //
    std::string checksum;

    // Size in bytes, if the manifest lists it.
    //
    std::optional<std::uint64_t> size;
  };

  // Release manifest (<version>/manifest.json).
  //
  // {
  //   "version": "1.2.3",
  //   "platforms": {
  //     "darwin-arm64": { "checksum": "<hex-sha256>", "size": 123 },
  //     ...
  //   }
  // }
  //
  // Only platforms.<key>.checksum is required. Unknown members are
  // ignored so that newer manifests keep working.
  //
  struct release_manifest
  {
    std::string version;

    // Platform entries as published, validated on selection.
    //
    std::map<std::string, boost::json::value> platforms;
  };

  // Throw manifest_error if the text is not valid JSON or does not have
  // the expected shape. Platform entries are not looked into.
  //
  release_manifest
  parse_release_manifest (const std::string& json);

  // Throw unsupported_platform_error if the manifest has no entry for the
  // platform and manifest_error if the entry is malformed. Keys are
  // matched exactly.
  //
  checksum_entry
  select_platform_entry (const release_manifest&, const std::string& platform);
}
