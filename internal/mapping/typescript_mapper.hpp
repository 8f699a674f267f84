#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/mapping/position_mapper.hpp"

namespace srepl::mapping {

/*
  Maps TypeScript sources to the JavaScript and source maps `tsc` emits
  for them, based on the project's tsconfig.json.

  Only single-root projects are supported: every source must live under
  one source root so that its artifact path is a pure path rewrite.
*/
class TypescriptMapper final : public PositionMapper {
 public:
  // Searches `root` and its ancestors for `config_file_name`.
  // Throws MapperError.
  static std::unique_ptr<TypescriptMapper> Create(const std::filesystem::path& root, const std::string& config_file_name = "tsconfig.json");

  // Roots as resolved by Create; no configuration is read.
  TypescriptMapper(std::filesystem::path config_path, std::filesystem::path source_root, std::filesystem::path out_root);

  ArtifactPaths ArtifactFor(const std::filesystem::path& source_path) const override;

  std::unique_ptr<MappingTable> LoadTable(const std::filesystem::path& mapping_table_path) const override;

  const std::filesystem::path& config_path() const {
    return config_path_;
  }

  const std::filesystem::path& source_root() const {
    return source_root_;
  }

  const std::filesystem::path& out_root() const {
    return out_root_;
  }

 private:
  std::filesystem::path config_path_;
  std::filesystem::path source_root_;
  std::filesystem::path out_root_;
};

} // namespace srepl::mapping
