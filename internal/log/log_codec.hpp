#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "internal/log/log_entry.hpp"

namespace srepl::log {

/*
  Line codec for the probe log.

    relativePath:line[:column] :: percent-encoded-result

  The result is percent-encoded so that delimiters, line breaks and
  arbitrary bytes inside it cannot break line-oriented parsing.
*/

inline constexpr std::string_view kDelimiter = " :: ";

std::string Encode(const std::filesystem::path& base_directory, const LogEntry& entry);

// Returns std::nullopt for any malformed line.
std::optional<LogEntry> Decode(const std::filesystem::path& base_directory, std::string_view log_line);

// Parses "path:line[:column]", dropping a "?query" suffix from the path.
std::optional<FileLocation> ParseFileLocation(std::string_view location);

std::string                PercentEncode(std::string_view text);
std::optional<std::string> PercentDecode(std::string_view text);

} // namespace srepl::log
