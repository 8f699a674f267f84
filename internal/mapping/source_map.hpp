#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/mapping/position_mapper.hpp"

namespace srepl::mapping {

/*
  Source map revision 3 decoder.

  `mappings` is decoded eagerly into per-line segment lists; Resolve is a
  binary search on the generated line.
*/
class SourceMap final : public MappingTable {
 public:
  struct Segment {
    uint32_t generated_column{0};
    bool     has_source{false};
    uint32_t source_index{0};
    uint32_t original_line{0};
    uint32_t original_column{0};
  };

  // Throws util::TransientFault.
  static SourceMap FromFile(const std::filesystem::path& path);
  static SourceMap FromJson(std::string_view json);

  std::optional<Location> Resolve(const Location& executed) const override;

  const std::vector<std::string>& sources() const {
    return sources_;
  }

  const std::vector<std::vector<Segment>>& lines() const {
    return lines_;
  }

 private:
  SourceMap(std::vector<std::string> sources, std::vector<std::vector<Segment>> lines);

  std::vector<std::string>          sources_;
  std::vector<std::vector<Segment>> lines_;
};

// Decodes a `mappings` string. Throws util::TransientFault on bad VLQ data.
std::vector<std::vector<SourceMap::Segment>> DecodeMappings(std::string_view mappings);

} // namespace srepl::mapping
