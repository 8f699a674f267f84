#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace srepl::util {

/*
  Whole-file helpers used by the orchestrator and the strip tool.
  Content is treated as raw bytes; no newline translation happens.
*/

// Returns std::nullopt when the file does not exist or cannot be opened.
std::optional<std::string> ReadFile(const std::filesystem::path& path);

// Throws std::runtime_error on failure.
void WriteFile(const std::filesystem::path& path, const std::string& content);

// Creates the file when missing. Throws std::runtime_error on failure.
void AppendFile(const std::filesystem::path& path, const std::string& content);

// Missing files are not an error; returns whether a file was removed.
bool RemoveIfExists(const std::filesystem::path& path);

} // namespace srepl::util
