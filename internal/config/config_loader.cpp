#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "internal/util/errors.hpp"

namespace pbxpatch::config {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

std::optional<double> ParseNumber(std::string_view text) {
  if (text.empty()) return std::nullopt;
  double     number = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), number);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size() || !std::isfinite(number)) return std::nullopt;
  return number;
}

// Plain scalars may be booleans or numbers; quoted scalars are strings.
Value ScalarToValue(const YAML::Node& node) {
  Value       value;
  const auto& text = node.Scalar();

  if (node.Tag() != "!") {
    if (text == "true" || text == "false") {
      value.set_bool_value(text == "true");
      return value;
    }
    if (const auto number = ParseNumber(text)) {
      value.set_number_value(*number);
      return value;
    }
  }
  value.set_string_value(text);
  return value;
}

class YamlConverter {
 public:
  explicit YamlConverter(std::string path) : path_(std::move(path)) {}

  Struct Document(const YAML::Node& root) const {
    if (!root.IsMap()) Fail(root, "top level must be a mapping");
    return Mapping(root);
  }

 private:
  Value Convert(const YAML::Node& node) const {
    Value value;
    switch (node.Type()) {
      case YAML::NodeType::Null:
        value.set_null_value(google::protobuf::NULL_VALUE);
        return value;
      case YAML::NodeType::Scalar:
        return ScalarToValue(node);
      case YAML::NodeType::Sequence: {
        auto* list = value.mutable_list_value();
        for (const auto& item : node) {
          *list->add_values() = Convert(item);
        }
        return value;
      }
      case YAML::NodeType::Map:
        *value.mutable_struct_value() = Mapping(node);
        return value;
      default:
        Fail(node, "unsupported node");
    }
  }

  Struct Mapping(const YAML::Node& node) const {
    Struct mapping;
    auto&  fields = *mapping.mutable_fields();
    for (const auto& entry : node) {
      if (!entry.first.IsScalar()) Fail(entry.first, "keys must be scalars");
      const auto& key = entry.first.Scalar();
      if (fields.count(key)) Fail(entry.first, "duplicate key '" + key + "'");
      fields[key] = Convert(entry.second);
    }
    return mapping;
  }

  [[noreturn]] void Fail(const YAML::Node& node, const std::string& reason) const {
    const auto mark = node.Mark();
    if (mark.is_null()) throw util::InvalidConfig(path_ + ": " + reason);
    throw util::InvalidConfig(path_ + ":" + std::to_string(mark.line + 1) + ": " + reason);
  }

  std::string path_;
};

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

pbxpatch::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig(path + ": " + e.what());
  }

  pbxpatch::runtime::config::RuntimeConfig config;
  if (root.IsNull()) return config;

  const auto document = YamlConverter(path).Document(root);

  std::string json;
  if (const auto status = google::protobuf::util::MessageToJsonString(document, &json); !status.ok()) {
    throw util::InvalidConfig(path + ": " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (const auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw util::InvalidConfig(path + ": " + std::string(status.message()));
  }
  return config;
}

} // namespace pbxpatch::config
