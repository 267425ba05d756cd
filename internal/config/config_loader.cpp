#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "internal/core/booking_policy.hpp"
#include "internal/util/local_time.hpp"

namespace woki::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("12:00", "007")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
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
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

woki::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json_status.ToString());
  }

  woki::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + status.ToString());
  }

  Validate(config);
  return config;
}

// ------------------------------------------------------------
// Inventory checks
// ------------------------------------------------------------

void ConfigLoader::Validate(const woki::runtime::config::RuntimeConfig& config) {
  auto fail = [](const std::string& what) { throw std::runtime_error("Invalid configuration: " + what); };

  // unset fields fall back to defaults, so compare what the engine will run with
  const auto& booking   = config.booking();
  const auto  effective = woki::core::BookingPolicy::FromConfig(booking);
  if (effective.min_duration_minutes > effective.max_duration_minutes) {
    fail("booking duration bounds are inverted: min " + std::to_string(effective.min_duration_minutes) + " > max " +
         std::to_string(effective.max_duration_minutes) + " minutes");
  }
  if (booking.max_combo_size() == 1) {
    fail("booking.max_combo_size must be at least 2");
  }

  const auto& export_metrics = config.observability().metrics();
  const auto  interval_ms    = export_metrics.export_interval_ms() > 0 ? export_metrics.export_interval_ms() : 1000;
  if (export_metrics.export_timeout_ms() > interval_ms) {
    fail("observability.metrics.export_timeout_ms exceeds the export interval of " + std::to_string(interval_ms) + " ms");
  }

  std::unordered_set<std::string> restaurant_ids;
  std::unordered_set<std::string> sector_ids;
  std::unordered_set<std::string> table_ids;

  for (const auto& restaurant : config.inventory().restaurants()) {
    if (restaurant.id().empty()) {
      fail("restaurant without id");
    }
    if (!restaurant_ids.insert(restaurant.id()).second) {
      fail("duplicate restaurant id " + restaurant.id());
    }

    const auto& zone = restaurant.timezone().empty() ? std::string("UTC") : restaurant.timezone();
    absl::TimeZone unused;
    if (!absl::LoadTimeZone(zone, &unused)) {
      fail("restaurant " + restaurant.id() + " has unknown timezone " + zone);
    }

    for (const auto& window : restaurant.service_windows()) {
      const auto start = util::ParseTimeOfDay(window.start());
      const auto end   = util::ParseTimeOfDay(window.end());
      if (!start || !end || *end <= *start) {
        fail("restaurant " + restaurant.id() + " has malformed service window " + window.start() + "-" + window.end());
      }
    }

    for (const auto& sector : restaurant.sectors()) {
      if (sector.id().empty() || !sector_ids.insert(sector.id()).second) {
        fail("missing or duplicate sector id in restaurant " + restaurant.id());
      }
      for (const auto& table : sector.tables()) {
        if (table.id().empty() || !table_ids.insert(table.id()).second) {
          fail("missing or duplicate table id in sector " + sector.id());
        }
        if (table.min_size() > table.max_size()) {
          fail("table " + table.id() + " has min_size greater than max_size");
        }
      }
    }
  }
}

} // namespace woki::config
