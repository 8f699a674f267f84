#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/mapping/location.hpp"

namespace srepl::mapping {

/*
  Position-mapping table of one derived artifact.

  Cheap to query; loaded once per synchronization cycle because the
  toolchain rewrites it on every build.
*/
class MappingTable {
 public:
  virtual ~MappingTable() = default;

  // Executed-artifact location -> authored-source location.
  virtual std::optional<Location> Resolve(const Location& executed) const = 0;
};

/*
  Toolchain-level mapper.

  Expensive to construct (parses the project's build configuration), so a
  watch session builds one per toolchain and keeps it for its lifetime.
*/
class PositionMapper {
 public:
  virtual ~PositionMapper() = default;

  virtual ArtifactPaths ArtifactFor(const std::filesystem::path& source_path) const = 0;

  // Throws util::TransientFault when the table is missing or malformed.
  virtual std::unique_ptr<MappingTable> LoadTable(const std::filesystem::path& mapping_table_path) const = 0;
};

using PositionMapperPtr = std::unique_ptr<PositionMapper>;

/*
  Construction failure of a PositionMapper.

  These are configuration faults: the toolchain stays unmappable until the
  session restarts.
*/
class MapperError : public std::runtime_error {
 public:
  enum class Reason {
    kNoBuildConfiguration,
    kEmissionDisabled,
    kMappingTablesDisabled,
    kMultipleSourceRoots,
  };

  MapperError(Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  Reason reason() const {
    return reason_;
  }

 private:
  Reason reason_;
};

const char* ReasonName(MapperError::Reason reason);

} // namespace srepl::mapping
