#include "internal/mapping/typescript_mapper.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/mapping/jsonc.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using srepl::mapping::Location;
using srepl::mapping::MapperError;
using srepl::mapping::StripJsonComments;
using srepl::mapping::TypescriptMapper;

fs::path MakeProject(const std::string& test_name, const std::string& tsconfig) {
  const auto dir = fs::temp_directory_path() / "srepl_typescript_mapper_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir / "src" / "nested");

  std::ofstream out(dir / "tsconfig.json");
  out << tsconfig;
  return dir;
}

MapperError::Reason CreateFailure(const fs::path& root) {
  try {
    (void)TypescriptMapper::Create(root);
  } catch (const MapperError& e) {
    return e.reason();
  }
  assert(false && "TypescriptMapper::Create must fail");
  return MapperError::Reason::kNoBuildConfiguration;
}

void TestStripJsonComments() {
  const std::string jsonc = "{\n"
                            "  // emitted output\n"
                            "  \"outDir\": \"dist\", /* block */\n"
                            "  \"include\": [\"src/**/*\",],\n"
                            "  \"url\": \"http://x\",\n"
                            "}\n";
  const auto json = StripJsonComments(jsonc);
  assert(json.find("emitted") == std::string::npos);
  assert(json.find("block") == std::string::npos);
  assert(json.find("\"src/**/*\"") != std::string::npos);
  assert(json.find("http://x") != std::string::npos);
  assert(json.find(",]") == std::string::npos);
  assert(json.find(",\n}") == std::string::npos);
}

void TestArtifactPathsUnderOutDir() {
  const auto dir = MakeProject("out_dir", R"({
  "compilerOptions": {
    "outDir": "dist",
    "rootDir": "src",
    "sourceMap": true, // trailing comment
    "strict": true,
  },
  "include": ["src/**/*"]
})");

  auto mapper = TypescriptMapper::Create(dir / "src");
  assert(mapper->config_path() == dir / "tsconfig.json");
  assert(mapper->source_root() == dir / "src");
  assert(mapper->out_root() == dir / "dist");

  auto paths = mapper->ArtifactFor(dir / "src" / "nested" / "app.ts");
  assert(paths.artifact_path == dir / "dist" / "nested" / "app.js");
  assert(paths.mapping_table_path == dir / "dist" / "nested" / "app.js.map");

  assert(mapper->ArtifactFor(dir / "src" / "esm.mts").artifact_path == dir / "dist" / "esm.mjs");
  assert(mapper->ArtifactFor(dir / "src" / "cjs.cts").artifact_path == dir / "dist" / "cjs.cjs");
  assert(mapper->ArtifactFor(dir / "src" / "view.tsx").artifact_path == dir / "dist" / "view.js");
}

void TestSourceRootFromIncludeAndDefaultOutDir() {
  const auto dir = MakeProject("include_root", R"({"compilerOptions": {"sourceMap": true}, "include": ["src/**/*", "src/extra.ts"]})");

  auto mapper = TypescriptMapper::Create(dir);
  assert(mapper->source_root() == dir / "src");
  assert(mapper->out_root() == dir / "src");
  assert(mapper->ArtifactFor(dir / "src" / "a.ts").artifact_path == dir / "src" / "a.js");
}

void TestMapperFromResolvedRoots() {
  TypescriptMapper mapper("/work/tsconfig.json", "/work/lib", "/work/build");
  assert(mapper.config_path() == "/work/tsconfig.json");
  assert(mapper.ArtifactFor("/work/lib/deep/util.cts").artifact_path == "/work/build/deep/util.cjs");
  assert(mapper.ArtifactFor("/work/lib/deep/util.cts").mapping_table_path == "/work/build/deep/util.cjs.map");
}

void TestLoadTableResolvesPositions() {
  const auto dir = MakeProject("load_table", R"({"compilerOptions": {"sourceMap": true, "outDir": "out"}})");
  fs::create_directories(dir / "out");
  {
    std::ofstream out(dir / "out" / "app.js.map");
    out << R"({"version":3,"sources":["../app.ts"],"names":[],"mappings":";;AAEE"})";
  }

  auto mapper = TypescriptMapper::Create(dir);
  auto table  = mapper->LoadTable(mapper->ArtifactFor(dir / "app.ts").mapping_table_path);
  assert(table->Resolve({3, 1}) == std::optional<Location>(Location{3, 3}));

  bool threw = false;
  try {
    (void)mapper->LoadTable(dir / "out" / "missing.js.map");
  } catch (const srepl::util::TransientFault&) {
    threw = true;
  }
  assert(threw);
}

void TestConstructionFailures() {
  const auto empty = fs::temp_directory_path() / "srepl_typescript_mapper_tests" / "no_config";
  fs::remove_all(empty);
  fs::create_directories(empty);
  if (!fs::exists(fs::path("/") / "tsconfig.json") && !fs::exists(fs::temp_directory_path() / "tsconfig.json")) {
    assert(CreateFailure(empty) == MapperError::Reason::kNoBuildConfiguration);
  }

  assert(CreateFailure(MakeProject("invalid", "{ \"compilerOptions\": ")) == MapperError::Reason::kNoBuildConfiguration);
  assert(CreateFailure(MakeProject("no_emit", R"({"compilerOptions": {"noEmit": true, "sourceMap": true}})")) ==
         MapperError::Reason::kEmissionDisabled);
  assert(CreateFailure(MakeProject("declarations", R"({"compilerOptions": {"emitDeclarationOnly": true}})")) ==
         MapperError::Reason::kEmissionDisabled);
  assert(CreateFailure(MakeProject("no_maps", R"({"compilerOptions": {"outDir": "dist"}})")) == MapperError::Reason::kMappingTablesDisabled);
  assert(CreateFailure(MakeProject("inline_maps", R"({"compilerOptions": {"sourceMap": true, "inlineSourceMap": true}})")) ==
         MapperError::Reason::kMappingTablesDisabled);
  assert(CreateFailure(MakeProject("root_dirs", R"({"compilerOptions": {"sourceMap": true, "rootDirs": ["a", "b"]}})")) ==
         MapperError::Reason::kMultipleSourceRoots);
  assert(CreateFailure(MakeProject("includes", R"({"compilerOptions": {"sourceMap": true}, "include": ["src/**/*", "lib/**/*"]})")) ==
         MapperError::Reason::kMultipleSourceRoots);
}

} // namespace

int main() {
  TestStripJsonComments();
  TestArtifactPathsUnderOutDir();
  TestSourceRootFromIncludeAndDefaultOutDir();
  TestMapperFromResolvedRoots();
  TestLoadTableResolvesPositions();
  TestConstructionFailures();

  std::cout << "srepl_unit_typescript_mapper: pass\n";
  return 0;
}
