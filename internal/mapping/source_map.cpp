#include "internal/mapping/source_map.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cstdint>

#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "mapping/source_map.pb.h"

namespace srepl::mapping {

using srepl::util::TransientFault;

namespace {

constexpr int kVlqBaseShift       = 5;
constexpr int kVlqBase            = 1 << kVlqBaseShift;
constexpr int kVlqBaseMask        = kVlqBase - 1;
constexpr int kVlqContinuationBit = kVlqBase;

int Base64Digit(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return 26 + (c - 'a');
  if (c >= '0' && c <= '9') return 52 + (c - '0');
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

// Reads one Base64 VLQ value starting at `pos`, advancing it.
int64_t ReadVlq(std::string_view text, std::size_t& pos) {
  int64_t result = 0;
  int     shift  = 0;
  while (true) {
    if (pos >= text.size()) {
      throw TransientFault("source map: truncated VLQ value");
    }
    const int digit = Base64Digit(text[pos++]);
    if (digit < 0) {
      throw TransientFault("source map: invalid base64 digit in mappings");
    }
    if (shift > 60) {
      throw TransientFault("source map: VLQ value out of range");
    }
    result += static_cast<int64_t>(digit & kVlqBaseMask) << shift;
    shift += kVlqBaseShift;
    if ((digit & kVlqContinuationBit) == 0) {
      break;
    }
  }

  const bool negative = (result & 1) != 0;
  result >>= 1;
  return negative ? -result : result;
}

uint32_t Accumulate(int64_t& state, int64_t delta, const char* field) {
  state += delta;
  if (state < 0 || state > UINT32_MAX) {
    throw TransientFault(std::string("source map: negative ") + field);
  }
  return static_cast<uint32_t>(state);
}

} // namespace

std::vector<std::vector<SourceMap::Segment>> DecodeMappings(std::string_view mappings) {
  std::vector<std::vector<SourceMap::Segment>> lines(1);

  // Every field except the generated column is relative across lines.
  int64_t source_index     = 0;
  int64_t original_line    = 0;
  int64_t original_column  = 0;
  int64_t name_index       = 0;
  int64_t generated_column = 0;

  std::size_t pos = 0;
  while (pos < mappings.size()) {
    const char c = mappings[pos];
    if (c == ';') {
      lines.emplace_back();
      generated_column = 0;
      ++pos;
      continue;
    }
    if (c == ',') {
      ++pos;
      continue;
    }

    SourceMap::Segment segment;
    segment.generated_column = Accumulate(generated_column, ReadVlq(mappings, pos), "generated column");

    const auto field_follows = [&] { return pos < mappings.size() && mappings[pos] != ',' && mappings[pos] != ';'; };
    if (field_follows()) {
      segment.has_source      = true;
      segment.source_index    = Accumulate(source_index, ReadVlq(mappings, pos), "source index");
      if (!field_follows()) {
        throw TransientFault("source map: segment with source but no original line");
      }
      segment.original_line   = Accumulate(original_line, ReadVlq(mappings, pos), "original line");
      if (!field_follows()) {
        throw TransientFault("source map: segment with source but no original column");
      }
      segment.original_column = Accumulate(original_column, ReadVlq(mappings, pos), "original column");
      if (field_follows()) {
        Accumulate(name_index, ReadVlq(mappings, pos), "name index");
      }
      if (field_follows()) {
        throw TransientFault("source map: segment has more than five fields");
      }
    }

    lines.back().push_back(segment);
  }

  for (auto& line : lines) {
    std::stable_sort(line.begin(), line.end(), [](const SourceMap::Segment& a, const SourceMap::Segment& b) {
      return a.generated_column < b.generated_column;
    });
  }
  return lines;
}

SourceMap::SourceMap(std::vector<std::string> sources, std::vector<std::vector<Segment>> lines)
    : sources_(std::move(sources)), lines_(std::move(lines)) {
}

SourceMap SourceMap::FromFile(const std::filesystem::path& path) {
  auto content = srepl::util::ReadFile(path);
  if (!content) {
    throw TransientFault("source map not readable: " + path.string());
  }
  return FromJson(*content);
}

SourceMap SourceMap::FromJson(std::string_view json) {
  srepl::mapping::SourceMapV3 message;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &message, options);
  if (!status.ok()) {
    throw TransientFault("source map not parseable: " + std::string(status.message()));
  }
  if (message.version() != 3) {
    throw TransientFault("unsupported source map version " + std::to_string(message.version()));
  }

  std::vector<std::string> sources(message.sources().begin(), message.sources().end());
  return SourceMap(std::move(sources), DecodeMappings(message.mappings()));
}

std::optional<Location> SourceMap::Resolve(const Location& executed) const {
  if (executed.line == 0 || executed.line > lines_.size() || executed.column == 0) {
    return std::nullopt;
  }

  const auto&    segments = lines_[executed.line - 1];
  const uint32_t column   = executed.column - 1;

  // greatest segment whose generated column is not after the query
  auto it = std::upper_bound(segments.begin(), segments.end(), column,
                             [](uint32_t value, const Segment& segment) { return value < segment.generated_column; });
  if (it == segments.begin()) {
    return std::nullopt;
  }
  --it;
  if (!it->has_source) {
    return std::nullopt;
  }

  return Location{it->original_line + 1, it->original_column + 1};
}

} // namespace srepl::mapping
