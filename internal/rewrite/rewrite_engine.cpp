#include "internal/rewrite/rewrite_engine.hpp"

#include <algorithm>
#include <map>

#include "internal/rewrite/markers.hpp"

namespace srepl::rewrite {

using srepl::log::LogEntry;

namespace {

bool HasCarriageReturn(std::string_view line) {
  return !line.empty() && line.back() == '\r';
}

std::string_view WithoutCarriageReturn(std::string_view line) {
  if (HasCarriageReturn(line)) {
    line.remove_suffix(1);
  }
  return line;
}

// The part of a line in front of its trailing annotation, if any.
std::string_view CodePart(std::string_view line) {
  line              = WithoutCarriageReturn(line);
  const auto marker = line.find(kTrailingMarker);
  return marker == std::string_view::npos ? line : line.substr(0, marker);
}

bool OpensBlock(std::string_view line) {
  const auto first = line.find_first_not_of(" \t");
  return first != std::string_view::npos && line.substr(first, kBlockOpen.size()) == kBlockOpen;
}

// Index of the line closing the block opened on lines[open].
std::optional<std::size_t> BlockEnd(const std::vector<std::string>& lines, std::size_t open) {
  std::string_view first = WithoutCarriageReturn(lines[open]);
  first.remove_prefix(first.find(kBlockOpen) + kBlockOpen.size());
  if (first.ends_with(kBlockClose)) {
    return open;
  }

  for (std::size_t i = open + 1; i < lines.size(); ++i) {
    if (WithoutCarriageReturn(lines[i]).ends_with(kBlockClose)) {
      return i;
    }
  }
  return std::nullopt;
}

struct BlockClose {
  std::size_t begin;
  std::size_t end;
  bool        at_end_of_text;
};

// First "*/" at or after `from` that is followed by a line break or by the
// end of the text.
std::optional<BlockClose> FindBlockClose(std::string_view text, std::size_t from) {
  auto pos = text.find(kBlockClose, from);
  while (pos != std::string_view::npos) {
    const auto after = pos + kBlockClose.size();
    if (after == text.size()) {
      return BlockClose{pos, after, true};
    }
    if (text[after] == '\n') {
      return BlockClose{pos, after + 1, false};
    }
    if (text[after] == '\r' && after + 1 < text.size() && text[after + 1] == '\n') {
      return BlockClose{pos, after + 2, false};
    }
    pos = text.find(kBlockClose, pos + 1);
  }
  return std::nullopt;
}

std::string StripBlocks(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto open = text.find(kBlockOpen, i);
    if (open == std::string_view::npos) {
      break;
    }

    const auto close = FindBlockClose(text, open + kBlockOpen.size());
    if (!close) {
      break;
    }

    // Take the indentation in front of the marker with it.
    const auto line_break = text.rfind('\n', open);
    const auto line_start = line_break == std::string_view::npos ? 0 : line_break + 1;
    const bool own_line   = line_start >= i && text.substr(line_start, open - line_start).find_first_not_of(" \t") == std::string_view::npos;
    const auto begin      = own_line ? line_start : open;

    out.append(text.substr(i, begin - i));

    // A block closing the text also owns the line break in front of it.
    if (close->at_end_of_text && own_line && !out.empty() && out.back() == '\n') {
      out.pop_back();
      if (!out.empty() && out.back() == '\r') {
        out.pop_back();
      }
    }

    i = close->end;
  }

  if (i < text.size()) {
    out.append(text.substr(i));
  }
  return out;
}

// Blank rendition of line[0, anchor): tabs stay tabs, anything else is a space.
std::string IndentUpTo(std::string_view line, uint32_t anchor_column) {
  line = WithoutCarriageReturn(line);

  const auto  limit = std::min<std::size_t>(anchor_column > 0 ? anchor_column - 1 : 0, line.size());
  std::string indent(limit, ' ');
  for (std::size_t i = 0; i < limit; ++i) {
    if (line[i] == '\t') {
      indent[i] = '\t';
    }
  }
  return indent;
}

std::string Join(const std::vector<std::string_view>& parts, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(parts[i]);
  }
  return out;
}

std::vector<std::string> RenderBlock(const std::vector<std::string_view>& results, const std::string& indent) {
  const auto body = SplitLines(Join(results, kBlockSeparator));

  // continuation lines line up under the first result
  const std::string continuation(kBlockOpen.size(), ' ');

  std::vector<std::string> block;
  block.reserve(body.size() + 1);
  for (std::size_t i = 0; i < body.size(); ++i) {
    block.push_back(indent + std::string(i == 0 ? kBlockOpen : continuation) + std::string(WithoutCarriageReturn(body[i])));
  }
  block.push_back(indent + std::string(kBlockClose));
  return block;
}

struct Annotation {
  std::size_t                   start_index;
  uint32_t                      anchor_column;
  std::vector<std::string_view> results;
};

} // namespace

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t              start = 0;
  while (true) {
    const auto pos = text.find('\n', start);
    if (pos == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      return lines;
    }
    lines.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string JoinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out.append(lines[i]);
  }
  return out;
}

std::string StripTrailing(std::string_view text) {
  auto lines = SplitLines(text);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    // block contents are not trailing annotations
    if (OpensBlock(lines[i])) {
      if (auto end = BlockEnd(lines, i)) {
        i = *end;
        continue;
      }
    }

    auto&      line   = lines[i];
    const auto marker = line.find(kTrailingMarker);
    if (marker == std::string::npos) {
      continue;
    }
    const bool carriage_return = HasCarriageReturn(line);
    line.erase(marker);
    if (carriage_return) {
      line.push_back('\r');
    }
  }
  return JoinLines(lines);
}

std::string Strip(std::string_view text) {
  return StripBlocks(StripTrailing(text));
}

std::optional<std::size_t> FindCallEnd(const std::vector<std::string>& lines, uint32_t line, uint32_t column) {
  if (line == 0 || line > lines.size()) {
    return std::nullopt;
  }

  const std::size_t start_index = line - 1;
  const auto        start_code  = CodePart(lines[start_index]);
  const std::size_t start       = column > 0 ? column - 1 : 0;
  if (start >= start_code.size()) {
    return std::nullopt;
  }

  // No opening paren next to the probe: not a call expression.
  const auto paren = start_code.find('(', start);
  if (paren == std::string_view::npos) {
    return std::nullopt;
  }

  int depth = 1;
  for (std::size_t i = start_index; i < lines.size(); ++i) {
    if (i != start_index && OpensBlock(lines[i])) {
      if (auto end = BlockEnd(lines, i)) {
        i = *end;
        continue;
      }
    }

    const auto code = CodePart(lines[i]);
    for (std::size_t c = (i == start_index ? paren + 1 : 0); c < code.size(); ++c) {
      if (code[c] == '(') {
        ++depth;
      } else if (code[c] == ')') {
        --depth;
      }
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::nullopt;
}

std::string Apply(std::string_view text, const std::vector<LogEntry>& entries) {
  auto lines = SplitLines(text);

  // Same-line entries keep call order.
  std::map<uint32_t, std::vector<const LogEntry*>> groups;
  for (const auto& entry : entries) {
    if (entry.line > 0) {
      groups[entry.line].push_back(&entry);
    }
  }

  // One annotation per call end line; groups ending on the same line merge.
  std::map<std::size_t, Annotation> annotations;
  for (const auto& [line, group] : groups) {
    // Leftmost known column so the scan starts no later than the earliest
    // call on the line; unknown columns scan from the line start.
    uint32_t anchor = 0;
    for (const auto* entry : group) {
      if (entry->column && *entry->column > 0 && (anchor == 0 || *entry->column < anchor)) {
        anchor = *entry->column;
      }
    }
    if (anchor == 0) {
      anchor = 1;
    }

    const auto end = FindCallEnd(lines, line, anchor);
    if (!end) {
      continue;
    }

    auto [it, inserted] = annotations.try_emplace(*end, Annotation{line - 1, anchor, {}});
    for (const auto* entry : group) {
      it->second.results.push_back(entry->result);
    }
  }

  std::vector<bool>                     deleted(lines.size(), false);
  std::vector<std::vector<std::string>> inserted_after(lines.size());

  for (const auto& [end, annotation] : annotations) {
    // A block left by a previous run is replaced, never stacked.
    if (end + 1 < lines.size() && OpensBlock(lines[end + 1])) {
      if (auto block_end = BlockEnd(lines, end + 1)) {
        for (std::size_t i = end + 1; i <= *block_end; ++i) {
          deleted[i] = true;
        }
      }
    }

    const bool  carriage_return = HasCarriageReturn(lines[end]);
    std::string code(CodePart(lines[end]));

    const bool multi_line = std::any_of(annotation.results.begin(), annotation.results.end(),
                                        [](std::string_view result) { return result.find('\n') != std::string_view::npos; });
    if (multi_line) {
      auto block = RenderBlock(annotation.results, IndentUpTo(lines[annotation.start_index], annotation.anchor_column));
      if (carriage_return) {
        for (auto& block_line : block) {
          block_line.push_back('\r');
        }
      }
      inserted_after[end] = std::move(block);
    } else {
      code.append(kTrailingMarker);
      code.append(Join(annotation.results, kTrailingSeparator));
    }

    if (carriage_return) {
      code.push_back('\r');
    }
    lines[end] = std::move(code);
  }

  std::vector<std::string> out;
  out.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (deleted[i]) {
      continue;
    }
    out.push_back(std::move(lines[i]));
    for (auto& block_line : inserted_after[i]) {
      out.push_back(std::move(block_line));
    }
  }
  return JoinLines(out);
}

} // namespace srepl::rewrite
