#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/log/log_entry.hpp"

namespace srepl::rewrite {

/*
  Text-rewrite algorithm for probe annotations.

  All functions are pure: they take the file content and return the new
  content. Lines are split on '\n' only; a '\r' before it stays part of the
  line and is preserved on every line the engine touches.

  Properties relied on by the orchestrator:
    Strip(Apply(Strip(T), E)) == Strip(T)
    Apply(Apply(S, E), E)     == Apply(S, E)   (same line numbering)
    Strip(T) == T             when T has no markers
*/

// Removes every trailing and block annotation.
std::string Strip(std::string_view text);

// Removes trailing annotations only; keeps line numbering intact.
std::string StripTrailing(std::string_view text);

// Inserts or replaces one annotation per call site named by `entries`.
// Entry lines/columns are 1-based positions in `text`; file paths are
// ignored.
std::string Apply(std::string_view text, const std::vector<srepl::log::LogEntry>& entries);

// Index of the line holding the ')' that closes the first call whose '('
// is at or after (line, column), both 1-based. std::nullopt when there is
// no '(' on that line or the parentheses never balance.
std::optional<std::size_t> FindCallEnd(const std::vector<std::string>& lines, uint32_t line, uint32_t column);

std::vector<std::string> SplitLines(std::string_view text);
std::string              JoinLines(const std::vector<std::string>& lines);

} // namespace srepl::rewrite
