#include "internal/mapping/jsonc.hpp"

namespace srepl::mapping {

std::string StripJsonComments(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  // index in `out` of a comma that may turn out to be trailing
  std::string::size_type pending_comma = std::string::npos;

  std::size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];

    if (c == '"') {
      pending_comma = std::string::npos;
      out.push_back(c);
      ++i;
      while (i < text.size()) {
        const char s = text[i++];
        out.push_back(s);
        if (s == '\\' && i < text.size()) {
          out.push_back(text[i++]);
        } else if (s == '"') {
          break;
        }
      }
      continue;
    }

    if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
      while (i < text.size() && text[i] != '\n') {
        ++i;
      }
      continue;
    }

    if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
      const auto end = text.find("*/", i + 2);
      i              = end == std::string_view::npos ? text.size() : end + 2;
      out.push_back(' ');
      continue;
    }

    if (c == ']' || c == '}') {
      if (pending_comma != std::string::npos) {
        out[pending_comma] = ' ';
        pending_comma      = std::string::npos;
      }
    } else if (c == ',') {
      pending_comma = out.size();
    } else if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
      pending_comma = std::string::npos;
    }

    out.push_back(c);
    ++i;
  }
  return out;
}

} // namespace srepl::mapping
