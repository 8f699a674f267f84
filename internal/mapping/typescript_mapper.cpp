#include "internal/mapping/typescript_mapper.hpp"

#include <google/protobuf/util/json_util.h>

#include <optional>
#include <set>

#include "internal/mapping/jsonc.hpp"
#include "internal/mapping/source_map.hpp"
#include "internal/util/file_io.hpp"
#include "mapping/tsconfig.pb.h"

namespace srepl::mapping {

namespace fs = std::filesystem;

using Reason = MapperError::Reason;

namespace {

std::optional<fs::path> FindConfigFile(const fs::path& root, const std::string& name) {
  std::error_code ec;
  auto            dir = fs::absolute(root, ec).lexically_normal();
  if (ec) {
    return std::nullopt;
  }

  while (true) {
    const auto candidate = dir / name;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
    if (dir == dir.parent_path() || dir.empty()) {
      return std::nullopt;
    }
    dir = dir.parent_path();
  }
}

bool IsGlobComponent(const std::string& component) {
  return component.find_first_of("*?[{") != std::string::npos;
}

// "src/**/*" -> "src", "lib/index.ts" -> "lib", "**/*" -> ""
fs::path IncludeRoot(const std::string& pattern) {
  fs::path root;
  bool     saw_glob = false;
  for (const auto& component : fs::path(pattern)) {
    if (IsGlobComponent(component.string())) {
      saw_glob = true;
      break;
    }
    root /= component;
  }
  if (!saw_glob && root.has_extension()) {
    root = root.parent_path();
  }
  return root;
}

srepl::mapping::TsConfig ParseConfig(const fs::path& path) {
  auto content = srepl::util::ReadFile(path);
  if (!content) {
    throw MapperError(Reason::kNoBuildConfiguration, "cannot read " + path.string());
  }

  srepl::mapping::TsConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(StripJsonComments(*content), &config, options);
  if (!status.ok()) {
    throw MapperError(Reason::kNoBuildConfiguration, path.string() + " is not valid: " + std::string(status.message()));
  }
  return config;
}

fs::path ResolveSourceRoot(const srepl::mapping::TsConfig& config, const fs::path& config_dir) {
  const auto& options = config.compiler_options();
  if (!options.root_dir().empty()) {
    return (config_dir / options.root_dir()).lexically_normal();
  }

  if (options.root_dirs_size() > 1) {
    throw MapperError(Reason::kMultipleSourceRoots, "compilerOptions.rootDirs lists more than one source root");
  }
  if (options.root_dirs_size() == 1) {
    return (config_dir / options.root_dirs(0)).lexically_normal();
  }

  std::set<fs::path> roots;
  for (const auto& pattern : config.include()) {
    roots.insert((config_dir / IncludeRoot(pattern)).lexically_normal());
  }
  if (roots.size() > 1) {
    throw MapperError(Reason::kMultipleSourceRoots, "include spans more than one source root");
  }
  if (roots.size() == 1) {
    return *roots.begin();
  }
  return config_dir.lexically_normal();
}

std::string ArtifactExtension(const fs::path& source) {
  const auto ext = source.extension().string();
  if (ext == ".mts") {
    return ".mjs";
  }
  if (ext == ".cts") {
    return ".cjs";
  }
  return ".js";
}

} // namespace

TypescriptMapper::TypescriptMapper(fs::path config_path, fs::path source_root, fs::path out_root)
    : config_path_(std::move(config_path)), source_root_(std::move(source_root)), out_root_(std::move(out_root)) {
}

std::unique_ptr<TypescriptMapper> TypescriptMapper::Create(const fs::path& root, const std::string& config_file_name) {
  auto config_path = FindConfigFile(root, config_file_name);
  if (!config_path) {
    throw MapperError(Reason::kNoBuildConfiguration, "no " + config_file_name + " found from " + root.string());
  }

  const auto config     = ParseConfig(*config_path);
  const auto config_dir = config_path->parent_path();
  const auto& options   = config.compiler_options();

  if (options.no_emit() || options.emit_declaration_only()) {
    throw MapperError(Reason::kEmissionDisabled, config_path->string() + " disables JavaScript emission");
  }

  // inline source maps produce no separate table to read
  if (!options.source_map() || options.inline_source_map()) {
    throw MapperError(Reason::kMappingTablesDisabled, config_path->string() + " does not emit source map files");
  }

  auto source_root = ResolveSourceRoot(config, config_dir);
  auto out_root    = options.out_dir().empty() ? source_root : (config_dir / options.out_dir()).lexically_normal();

  return std::make_unique<TypescriptMapper>(*config_path, std::move(source_root), std::move(out_root));
}

ArtifactPaths TypescriptMapper::ArtifactFor(const fs::path& source_path) const {
  auto relative = source_path.lexically_normal().lexically_relative(source_root_);
  if (relative.empty()) {
    relative = source_path.filename();
  }

  auto artifact = (out_root_ / relative).lexically_normal();
  artifact.replace_extension(ArtifactExtension(source_path));

  auto table = artifact;
  table += ".map";
  return {artifact, table};
}

std::unique_ptr<MappingTable> TypescriptMapper::LoadTable(const fs::path& mapping_table_path) const {
  return std::make_unique<SourceMap>(SourceMap::FromFile(mapping_table_path));
}

} // namespace srepl::mapping
