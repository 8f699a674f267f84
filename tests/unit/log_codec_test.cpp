#include "internal/log/log_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using srepl::log::Decode;
using srepl::log::Encode;
using srepl::log::LogEntry;
using srepl::log::ParseFileLocation;
using srepl::log::PercentDecode;
using srepl::log::PercentEncode;

LogEntry MakeEntry(const std::string& path, uint32_t line, std::optional<uint32_t> column, const std::string& result) {
  LogEntry entry;
  entry.file_path = path;
  entry.line      = line;
  entry.column    = column;
  entry.result    = result;
  return entry;
}

void TestEncodeUsesRelativePathAndPercentEncoding() {
  const auto line = Encode("/work/project", MakeEntry("/work/project/src/app.js", 3, 7, "'a :: b'\n"));
  assert(line == "src/app.js:3:7 :: 'a%20%3A%3A%20b'%0A");
}

void TestEncodeOmitsUnknownColumn() {
  const auto line = Encode("/work", MakeEntry("/work/main.js", 12, std::nullopt, "42"));
  assert(line == "main.js:12 :: 42");
}

void TestDecodeRestoresEntry() {
  auto entry = Decode("/work/project", "src/app.js:3:7 :: %5B%201%2C%202%20%5D");
  assert(entry.has_value());
  assert(entry->file_path == std::filesystem::path("/work/project/src/app.js"));
  assert(entry->line == 3);
  assert(entry->column.has_value() && *entry->column == 7);
  assert(entry->result == "[ 1, 2 ]");
}

void TestDecodeToleratesCarriageReturnAndMissingColumn() {
  auto entry = Decode("/work", "lib/x.js:9 :: true\r");
  assert(entry.has_value());
  assert(entry->line == 9);
  assert(!entry->column.has_value());
  assert(entry->result == "true");
}

void TestDecodeRejectsMalformedLines() {
  assert(!Decode("/work", "no delimiter here").has_value());
  assert(!Decode("/work", "app.js :: 1").has_value());
  assert(!Decode("/work", "app.js:x:1 :: 1").has_value());
  assert(!Decode("/work", "app.js:1:2:3 :: 1").has_value());
  assert(!Decode("/work", "app.js:1:2 :: %G1").has_value());
  assert(!Decode("/work", "app.js:1:2 :: %4").has_value());
}

void TestParseFileLocationDropsQuery() {
  auto location = ParseFileLocation("/work/app.mjs?update=1700000000:4:2");
  assert(location.has_value());
  assert(location->path == "/work/app.mjs");
  assert(location->line == 4);
  assert(location->column.has_value() && *location->column == 2);
}

void TestPercentCodecPreservesArbitraryBytes() {
  std::string raw = "x :: y\r\n\t%";
  raw.push_back('\0');
  raw.push_back(static_cast<char>(0xE2));

  const auto encoded = PercentEncode(raw);
  assert(encoded.find(' ') == std::string::npos);
  assert(encoded.find('\n') == std::string::npos);
  assert(encoded.find(':') == std::string::npos);

  auto decoded = PercentDecode(encoded);
  assert(decoded.has_value());
  assert(*decoded == raw);
}

void TestUnreservedCharactersAreKept() {
  assert(PercentEncode("AZaz09-_.!~*'()") == "AZaz09-_.!~*'()");
  assert(PercentEncode("\"") == "%22");
}

} // namespace

int main() {
  TestEncodeUsesRelativePathAndPercentEncoding();
  TestEncodeOmitsUnknownColumn();
  TestDecodeRestoresEntry();
  TestDecodeToleratesCarriageReturnAndMissingColumn();
  TestDecodeRejectsMalformedLines();
  TestParseFileLocationDropsQuery();
  TestPercentCodecPreservesArbitraryBytes();
  TestUnreservedCharactersAreKept();

  std::cout << "srepl_unit_log_codec: pass\n";
  return 0;
}
