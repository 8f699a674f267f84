#include "internal/rewrite/rewrite_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using srepl::log::LogEntry;
using srepl::rewrite::Apply;
using srepl::rewrite::FindCallEnd;
using srepl::rewrite::SplitLines;
using srepl::rewrite::Strip;
using srepl::rewrite::StripTrailing;

LogEntry At(uint32_t line, std::optional<uint32_t> column, const std::string& result) {
  LogEntry entry;
  entry.file_path = "/work/app.js";
  entry.line      = line;
  entry.column    = column;
  entry.result    = result;
  return entry;
}

void TestSingleResultBecomesTrailingAnnotation() {
  const std::string text = "p(['Hello','world'].join(', '))";
  const auto        out  = Apply(text, {At(1, 1, "\"Hello, world\"")});
  assert(out == "p(['Hello','world'].join(', ')) //=> \"Hello, world\"");
}

void TestSameLineResultsWithLineBreakBecomeOneBlock() {
  const std::string text = "p(a) + p(b)\n";
  const auto        out  = Apply(text, {At(1, 1, "1"), At(1, 8, "{\n  a: 1\n}")});
  assert(out == "p(a) + p(b)\n"
                "/*=> 1,\n"
                "     {\n"
                "       a: 1\n"
                "     }\n"
                "*/\n");
}

void TestSameLineSingleLineResultsAreJoined() {
  const auto out = Apply("p(1); p(2)\n", {At(1, 1, "1"), At(1, 7, "2")});
  assert(out == "p(1); p(2) //=> 1, 2\n");
}

void TestUpdatedResultReplacesPriorAnnotation() {
  const auto out = Apply("p(1) //=> 1\n", {At(1, 1, "2")});
  assert(out == "p(1) //=> 2\n");
}

void TestBlockReplacedInPlace() {
  const std::string first  = Apply("p(x)\nnext()\n", {At(1, 1, "'a\\nb'\nsecond")});
  const std::string second = Apply(first, {At(1, 1, "'new'\nlines")});
  assert(second == "p(x)\n/*=> 'new'\n     lines\n*/\nnext()\n");

  // single-line result replaces the block with a trailing annotation
  const std::string third = Apply(second, {At(1, 1, "3")});
  assert(third == "p(x) //=> 3\nnext()\n");
}

void TestMultiLineCallAnnotatesClosingLine() {
  const std::string text = "p(\n  1 +\n  2\n)\n";
  const auto        out  = Apply(text, {At(1, 1, "3")});
  assert(out == "p(\n  1 +\n  2\n) //=> 3\n");
}

void TestEntryWithoutCallIsIgnored() {
  const std::string text = "const x = 5\n";
  assert(Apply(text, {At(1, 1, "5")}) == text);
  assert(Apply(text, {At(9, 1, "5")}) == text);
  assert(Apply(text, {At(0, 1, "5")}) == text);
}

void TestUnknownColumnScansFromLineStart() {
  const auto out = Apply("  log(p(2))\n", {At(1, std::nullopt, "2")});
  assert(out == "  log(p(2)) //=> 2\n");
}

void TestBlockIsIndentedLikeTheCallSite() {
  const std::string text = "  if (x) p(obj)\n";
  const auto        out  = Apply(text, {At(1, 11, "{\n}")});
  const std::string pad(10, ' ');
  assert(out == "  if (x) p(obj)\n" + pad + "/*=> {\n" + pad + "     }\n" + pad + "*/\n");
  assert(Strip(out) == text);

  const auto tabbed = Apply("\tx = p(obj)\n", {At(1, 6, "{\n}")});
  assert(tabbed == "\tx = p(obj)\n\t    /*=> {\n\t         }\n\t    */\n");
  assert(Strip(tabbed) == "\tx = p(obj)\n");
}

void TestCarriageReturnsArePreserved() {
  const std::string text = "p(1)\r\np(2)\r\n";
  const auto        out  = Apply(text, {At(1, 1, "1"), At(2, 1, "2")});
  assert(out == "p(1) //=> 1\r\np(2) //=> 2\r\n");
  assert(Strip(out) == text);

  const std::string block_text = "p(1)\r\n";
  const auto        block      = Apply(block_text, {At(1, 1, "a\nb")});
  assert(block == "p(1)\r\n/*=> a\r\n     b\r\n*/\r\n");
  assert(Strip(block) == block_text);
}

void TestBlockAtEndOfTextRoundTrips() {
  const std::string text = "p(1)";
  const auto        out  = Apply(text, {At(1, 1, "a\nb")});
  assert(out == "p(1)\n/*=> a\n     b\n*/");
  assert(Strip(out) == text);
}

void TestStripTrailingKeepsBlocks() {
  const std::string text = "p(1) //=> 1\n/*=> a //=> b\n     c\n*/\n";
  assert(StripTrailing(text) == "p(1)\n/*=> a //=> b\n     c\n*/\n");
  assert(Strip(text) == "p(1)\n");
}

void TestFindCallEnd() {
  const auto lines = SplitLines("p(f(1),\n  g(2)) + 1\nx()\n");
  assert(FindCallEnd(lines, 1, 1) == std::optional<std::size_t>(1));
  assert(FindCallEnd(lines, 3, 1) == std::optional<std::size_t>(2));
  assert(!FindCallEnd(lines, 2, 12).has_value());
  assert(!FindCallEnd(SplitLines("p(1"), 1, 1).has_value());
  assert(!FindCallEnd(lines, 4, 1).has_value());
}

void TestNoMarkerTextIsStable() {
  const std::vector<std::string> texts = {"", "\n", "const a = 1;\n", "a /* note */ b\r\nc // d\n", "x = '*/'\n"};
  for (const auto& text : texts) {
    assert(Strip(text) == text);
    assert(StripTrailing(text) == text);
  }
}

void TestApplyIsIdempotentAndStripRoundTrips() {
  const std::vector<std::string> texts = {
      "function f() {\n  p(1)\n  p(g(2),\n    3)\n}\n",
      "p(1)\r\nq(p(2))\r\n",
      "  p(a)",
  };
  const std::vector<std::vector<LogEntry>> batches = {
      {At(2, 3, "1"), At(3, 3, "'multi\\nline'\n[ 2, 3 ]")},
      {At(1, 1, "1"), At(2, 3, "2")},
      {At(1, 3, "[\n  1\n]")},
  };

  for (std::size_t i = 0; i < texts.size(); ++i) {
    const auto pristine = Strip(texts[i]);
    const auto once     = Apply(pristine, batches[i]);
    const auto twice    = Apply(once, batches[i]);

    assert(once != pristine);
    assert(twice == once);
    assert(Strip(once) == pristine);
    assert(Apply(pristine, batches[i]) == once);
  }
}

} // namespace

int main() {
  TestSingleResultBecomesTrailingAnnotation();
  TestSameLineResultsWithLineBreakBecomeOneBlock();
  TestSameLineSingleLineResultsAreJoined();
  TestUpdatedResultReplacesPriorAnnotation();
  TestBlockReplacedInPlace();
  TestMultiLineCallAnnotatesClosingLine();
  TestEntryWithoutCallIsIgnored();
  TestUnknownColumnScansFromLineStart();
  TestBlockIsIndentedLikeTheCallSite();
  TestCarriageReturnsArePreserved();
  TestBlockAtEndOfTextRoundTrips();
  TestStripTrailingKeepsBlocks();
  TestFindCallEnd();
  TestNoMarkerTextIsStable();
  TestApplyIsIdempotentAndStripRoundTrips();

  std::cout << "srepl_unit_rewrite_engine: pass\n";
  return 0;
}
