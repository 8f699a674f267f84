#pragma once

#include <cstdint>
#include <filesystem>

namespace srepl::mapping {

// 1-based line and column. Whether it addresses an executed artifact or an
// authored source is decided by the caller; only a MappingTable converts
// between the two.
struct Location {
  uint32_t line{0};
  uint32_t column{0};

  bool operator==(const Location&) const = default;
};

// Files a toolchain emits for one authored source.
struct ArtifactPaths {
  std::filesystem::path artifact_path;
  std::filesystem::path mapping_table_path;
};

} // namespace srepl::mapping
