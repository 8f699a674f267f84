#include "internal/log/log_codec.hpp"

#include <charconv>
#include <vector>

namespace srepl::log {
namespace {

bool IsUnreserved(unsigned char c) {
  if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '!':
    case '~':
    case '*':
    case '\'':
    case '(':
    case ')':
      return true;
    default:
      return false;
  }
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::optional<uint32_t> ParseNumber(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  uint32_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string_view> Split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  while (true) {
    const auto pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace

std::string PercentEncode(std::string_view text) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    if (IsUnreserved(c)) {
      out.push_back(ch);
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

std::optional<std::string> PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 2 >= text.size()) {
      return std::nullopt;
    }
    const int hi = HexNibble(text[i + 1]);
    const int lo = HexNibble(text[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

std::optional<FileLocation> ParseFileLocation(std::string_view location) {
  const auto parts = Split(location, ':');
  if (parts.size() < 2 || parts.size() > 3 || parts[0].empty() || parts[1].empty()) {
    return std::nullopt;
  }

  // Remove any cache busting artifacts
  auto path = parts[0];
  if (const auto query = path.find('?'); query != std::string_view::npos) {
    path = path.substr(0, query);
  }
  if (path.empty()) {
    return std::nullopt;
  }

  const auto line = ParseNumber(parts[1]);
  if (!line) {
    return std::nullopt;
  }

  FileLocation parsed{std::string(path), *line, std::nullopt};
  if (parts.size() == 3) {
    const auto column = ParseNumber(parts[2]);
    if (!column) {
      return std::nullopt;
    }
    parsed.column = *column;
  }
  return parsed;
}

std::string Encode(const std::filesystem::path& base_directory, const LogEntry& entry) {
  const auto relative = entry.file_path.lexically_relative(base_directory);

  std::string location = (relative.empty() ? entry.file_path : relative).generic_string();
  location += ':';
  location += std::to_string(entry.line);
  if (entry.column) {
    location += ':';
    location += std::to_string(*entry.column);
  }

  return location + std::string(kDelimiter) + PercentEncode(entry.result);
}

std::optional<LogEntry> Decode(const std::filesystem::path& base_directory, std::string_view log_line) {
  if (!log_line.empty() && log_line.back() == '\r') {
    log_line.remove_suffix(1);
  }

  const auto delimiter_index = log_line.find(kDelimiter);
  if (delimiter_index == std::string_view::npos) {
    return std::nullopt;
  }

  const auto loc = ParseFileLocation(log_line.substr(0, delimiter_index));
  if (!loc) {
    return std::nullopt;
  }

  auto result = PercentDecode(log_line.substr(delimiter_index + kDelimiter.size()));
  if (!result) {
    return std::nullopt;
  }

  LogEntry entry;
  entry.file_path = (base_directory / loc->path).lexically_normal();
  entry.line      = loc->line;
  entry.column    = loc->column;
  entry.result    = std::move(*result);
  return entry;
}

} // namespace srepl::log
