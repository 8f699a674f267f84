#include "file_io.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace srepl::util {

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }

  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::nullopt;
  }
  return content;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open for writing: " + path.string());
  }

  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) {
    throw std::runtime_error("write failed: " + path.string());
  }
}

void AppendFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  if (!out) {
    throw std::runtime_error("cannot open for appending: " + path.string());
  }

  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) {
    throw std::runtime_error("append failed: " + path.string());
  }
}

bool RemoveIfExists(const std::filesystem::path& path) {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw std::system_error(ec, "remove " + path.string());
  }
  return removed;
}

} // namespace srepl::util
