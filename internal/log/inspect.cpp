#include "internal/log/inspect.hpp"

#include <charconv>
#include <cmath>

namespace srepl::log::detail {

std::string QuoteString(std::string_view text) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('\'');
  for (char ch : text) {
    switch (ch) {
      case '\'':
        out += "\\'";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\v':
        out += "\\v";
        break;
      default: {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F) {
          out += "\\x";
          out.push_back(kHex[c >> 4]);
          out.push_back(kHex[c & 0x0F]);
        } else {
          out.push_back(ch);
        }
      }
    }
  }
  out.push_back('\'');
  return out;
}

std::string FormatDouble(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-Infinity" : "Infinity";
  }
  if (value == 0 && std::signbit(value)) {
    return "-0";
  }

  char buffer[64];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return "NaN";
  }
  return std::string(buffer, end);
}

std::string JoinElements(std::string_view open, const std::vector<std::string>& items, std::string_view close, std::size_t indent,
                         std::size_t break_length) {
  if (items.empty()) {
    return std::string(open) + std::string(close);
  }

  std::string single_line(open);
  single_line += ' ';
  bool multi_line = false;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (items[i].find('\n') != std::string::npos) {
      multi_line = true;
    }
    if (i > 0) {
      single_line += ", ";
    }
    single_line += items[i];
  }
  single_line += ' ';
  single_line += close;

  if (!multi_line && indent + single_line.size() <= break_length) {
    return single_line;
  }

  const std::string child_pad(indent + 2, ' ');
  std::string       out(open);
  out += '\n';
  for (std::size_t i = 0; i < items.size(); ++i) {
    out += child_pad;
    out += items[i];
    out += i + 1 < items.size() ? ",\n" : "\n";
  }
  out += std::string(indent, ' ');
  out += close;
  return out;
}

} // namespace srepl::log::detail
