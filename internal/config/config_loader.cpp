#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

#include "internal/config/runtime_defaults.hpp"

namespace ledger::config {

using ledger::runtime::config::RuntimeConfig;

namespace {

namespace pb = google::protobuf;

std::runtime_error ConfigError(const std::string& origin, const std::string& where, const std::string& what) {
  std::string message = "ledger config " + origin;
  if (!where.empty()) message += " at " + where;
  return std::runtime_error(message + ": " + what);
}

std::string Child(const std::string& where, const std::string& key) {
  return where.empty() ? key : where + "." + key;
}

// yaml-cpp tags quoted scalars with "!": "5000" in quotes stays a string
pb::Value FromScalar(const YAML::Node& node) {
  pb::Value          value;
  const std::string& text = node.Scalar();

  if (node.Tag() == "!") {
    value.set_string_value(text);
    return value;
  }
  if (text == "true" || text == "false") {
    value.set_bool_value(text == "true");
    return value;
  }
  if (text == "~" || text == "null") {
    value.set_null_value(pb::NULL_VALUE);
    return value;
  }

  errno           = 0;
  char*  end      = nullptr;
  double number   = std::strtod(text.c_str(), &end);
  bool   complete = !text.empty() && end != nullptr && *end == '\0';
  if (complete && errno != ERANGE) {
    value.set_number_value(number);
  } else {
    value.set_string_value(text);
  }
  return value;
}

pb::Value FromNode(const YAML::Node& node, const std::string& origin, const std::string& where) {
  pb::Value value;
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value.set_null_value(pb::NULL_VALUE);
      return value;

    case YAML::NodeType::Scalar:
      return FromScalar(node);

    case YAML::NodeType::Sequence: {
      auto* list = value.mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        *list->add_values() = FromNode(node[i], origin, where + "[" + std::to_string(i) + "]");
      }
      return value;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) throw ConfigError(origin, where, "keys must be scalars");
        const std::string key = entry.first.Scalar();
        fields[key]           = FromNode(entry.second, origin, Child(where, key));
      }
      return value;
    }

    default:
      throw ConfigError(origin, where, "unsupported YAML node");
  }
}

void Validate(const RuntimeConfig& config, const std::string& origin) {
  const auto& logging = config.logging();
  static constexpr const char* kLevels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
  bool known = false;
  for (const char* level : kLevels) known = known || logging.level() == level;
  if (!known) throw ConfigError(origin, "logging.level", "unknown level '" + logging.level() + "'");

  if (logging.sink() != "stderr" && logging.sink() != "stdout") {
    throw ConfigError(origin, "logging.sink", "expected stderr or stdout, got '" + logging.sink() + "'");
  }
}

RuntimeConfig FromDocument(const YAML::Node& document, const std::string& origin) {
  RuntimeConfig config;

  // an empty document means every default
  if (document.IsDefined() && !document.IsNull()) {
    if (!document.IsMap()) throw ConfigError(origin, "", "top level must be a mapping");

    std::string json;
    auto        status = pb::util::MessageToJsonString(FromNode(document, origin, ""), &json);
    if (!status.ok()) throw ConfigError(origin, "", std::string(status.message()));

    // unknown keys are errors
    pb::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    status                        = pb::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) throw ConfigError(origin, "", std::string(status.message()));
  }

  ApplyDefaults(&config);
  Validate(config, origin);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError(path, "", e.what());
  }
  return FromDocument(document, path);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node document;
  try {
    document = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw ConfigError("<string>", "", e.what());
  }
  return FromDocument(document, "<string>");
}

} // namespace ledger::config
