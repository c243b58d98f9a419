#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace chunkstore::config {

inline constexpr std::uint64_t kDefaultCapacity    = 5'000'000;
inline constexpr std::uint64_t kDefaultGcBatchSize = 200'000;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset store limits are filled with the defaults above.
*/
class ConfigLoader {
 public:
  static chunkstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(chunkstore::runtime::config::RuntimeConfig& config);
};

} // namespace chunkstore::config
