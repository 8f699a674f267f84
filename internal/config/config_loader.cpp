#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace srepl::config {

using srepl::runtime::config::RuntimeConfig;
using srepl::util::ConfigurationFault;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Imports argv[1] (a file:// URL) and awaits the export named by argv[2]
// when it is a function. CommonJS exports may only be reachable through
// the default export.
static constexpr const char* kNodeEntryScript =
    "const [url, entry] = process.argv.slice(1);"
    "const m = await import(url);"
    "const fn = typeof m[entry] === 'function' ? m[entry] : m.default?.[entry];"
    "if (typeof fn === 'function') await fn();";

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // quoted scalars stay strings ("8080" is a path segment, not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigurationFault("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationFault("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // An empty document means "all defaults".
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw ConfigurationFault("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw ConfigurationFault("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* watch = config->mutable_watch();
  if (watch->root().empty()) {
    watch->set_root(".");
  }
  if (watch->ignore().empty()) {
    watch->add_ignore(".git");
    watch->add_ignore("node_modules");
  }
  if (watch->poll_interval_ms() == 0) {
    watch->set_poll_interval_ms(250);
  }

  if (config->log_file().empty()) {
    config->set_log_file(".srepl.log");
  }
  if (config->debounce_ms() == 0) {
    config->set_debounce_ms(300);
  }

  if (config->runners().empty()) {
    auto* node = config->add_runners();
    for (const char* ext : {".js", ".jsx", ".mjs", ".cjs"}) {
      node->add_extensions(ext);
    }
    for (const char* arg : {"node", "--input-type=module", "-e", kNodeEntryScript, "{artifact_url}", "{entry}"}) {
      node->add_command(arg);
    }
  }
  for (auto& runner : *config->mutable_runners()) {
    if (runner.entry().empty()) {
      runner.set_entry("pr");
    }
  }

  if (config->toolchains().empty()) {
    config->add_toolchains();
  }
  for (auto& toolchain : *config->mutable_toolchains()) {
    if (toolchain.kind().empty()) {
      toolchain.set_kind("typescript");
    }
    if (toolchain.extensions().empty() && toolchain.kind() == "typescript") {
      for (const char* ext : {".ts", ".tsx", ".mts", ".cts"}) {
        toolchain.add_extensions(ext);
      }
    }
    if (toolchain.name().empty()) {
      toolchain.set_name(toolchain.kind());
    }
    if (toolchain.config_file().empty()) {
      toolchain.set_config_file("tsconfig.json");
    }
  }
}

} // namespace srepl::config
