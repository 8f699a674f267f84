#include "internal/log/inspect.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace {

using srepl::log::Inspect;
using srepl::log::InspectOptions;

struct Opaque {
  int value;
};

struct SelfList : std::vector<std::shared_ptr<SelfList>> {};

void TestScalars() {
  assert(Inspect(42) == "42");
  assert(Inspect(-7L) == "-7");
  assert(Inspect(true) == "true");
  assert(Inspect(nullptr) == "null");
  assert(Inspect(1.5) == "1.5");
  assert(Inspect(std::numeric_limits<double>::quiet_NaN()) == "NaN");
  assert(Inspect(-std::numeric_limits<double>::infinity()) == "-Infinity");
  assert(Inspect(-0.0) == "-0");
}

void TestStringsAreQuotedAndEscaped() {
  assert(Inspect(std::string("Hello, world")) == "'Hello, world'");
  assert(Inspect("it's") == "'it\\'s'");
  assert(Inspect(std::string("a\nb")) == "'a\\nb'");
  assert(Inspect(std::string(1, '\x01')) == "'\\x01'");
  assert(Inspect('x') == "'x'");
}

void TestOptionalAndPointers() {
  std::optional<int> missing;
  assert(Inspect(missing) == "undefined");
  assert(Inspect(std::optional<int>(3)) == "3");

  int        value   = 9;
  const int* pointer = &value;
  assert(Inspect(pointer) == "9");

  std::shared_ptr<int> empty;
  assert(Inspect(empty) == "null");
  assert(Inspect(std::make_unique<std::string>("boxed")) == "'boxed'");
}

void TestContainers() {
  assert(Inspect(std::vector<int>{}) == "[]");
  assert(Inspect(std::vector<int>{1, 2, 3}) == "[ 1, 2, 3 ]");
  assert(Inspect(std::make_tuple(1, std::string("a"), false)) == "[ 1, 'a', false ]");

  std::map<std::string, int> counts{{"a", 1}, {"b", 2}};
  assert(Inspect(counts) == "Map(2) { 'a' => 1, 'b' => 2 }");

  std::set<int> empty;
  assert(Inspect(empty) == "Set(0) {}");
  assert(Inspect(std::set<int>{3, 1}) == "Set(2) { 1, 3 }");
}

void TestNestingBeyondDepthIsElided() {
  std::vector<std::vector<std::vector<std::vector<int>>>> nested{{{{1}}}};
  assert(Inspect(nested) == "[ [ [ [Array] ] ] ]");

  InspectOptions shallow;
  shallow.depth = 0;
  std::vector<std::map<int, int>> maps{{{1, 2}}};
  assert(Inspect(maps, shallow) == "[ [Map] ]");
}

void TestLongOutputBreaksOneElementPerLine() {
  std::vector<std::string> words(10, "abcdefghij");
  const auto               rendered = Inspect(words);

  assert(rendered.rfind("[\n  'abcdefghij',\n", 0) == 0);
  assert(rendered.size() > 2 && rendered.substr(rendered.size() - 2) == "\n]");
  assert(rendered.find("'abcdefghij'\n]") != std::string::npos);
}

void TestCyclesAreMarked() {
  auto root = std::make_shared<SelfList>();
  root->push_back(root);

  assert(Inspect(root) == "[ [Circular] ]");

  root->clear();
}

void TestUnknownTypesRenderAsObject() {
  assert(Inspect(Opaque{1}) == "[object]");
}

} // namespace

int main() {
  TestScalars();
  TestStringsAreQuotedAndEscaped();
  TestOptionalAndPointers();
  TestContainers();
  TestNestingBeyondDepthIsElided();
  TestLongOutputBreaksOneElementPerLine();
  TestCyclesAreMarked();
  TestUnknownTypesRenderAsObject();

  std::cout << "srepl_unit_inspect: pass\n";
  return 0;
}
