#include "mcp/tools.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "mcp/jsonrpc.hpp"
#include "query/csv_export.hpp"

namespace netspeed::mcp {

namespace {

constexpr std::size_t kDefaultMaxPoints = 500;

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return fallback;
}

struct Range {
  std::int64_t from_ms{0};
  std::int64_t to_ms{0};
};

// Either {"window": "6h"} ending now, or explicit {"from", "to"} in Unix ms.
Range parse_range(const nlohmann::json& params, const core::Clock& clock) {
  const auto window_it = params.find("window");
  if (window_it != params.end()) {
    if (!window_it->is_string()) {
      throw JsonRpcException(kInvalidParams, "window must be a string such as \"15m\" or \"7d\"");
    }
    std::chrono::milliseconds window{0};
    try {
      window = core::parse_duration_ms(window_it->get<std::string>());
    } catch (const std::exception& ex) {
      throw JsonRpcException(kInvalidParams, std::string("invalid window: ") + ex.what());
    }
    if (window.count() <= 0) {
      throw JsonRpcException(kInvalidParams, "window must be positive");
    }
    const auto to_ms = clock();
    return Range{.from_ms = to_ms - window.count(), .to_ms = to_ms};
  }

  const auto from_it = params.find("from");
  const auto to_it = params.find("to");
  if (from_it == params.end() || to_it == params.end() || !from_it->is_number_integer() ||
      !to_it->is_number_integer()) {
    throw JsonRpcException(kInvalidParams, "provide window, or integer from and to in Unix milliseconds");
  }

  Range range{.from_ms = from_it->get<std::int64_t>(), .to_ms = to_it->get<std::int64_t>()};
  if (range.to_ms <= range.from_ms) {
    throw JsonRpcException(kInvalidParams, "to must be greater than from");
  }
  return range;
}

query::InterfaceFilter parse_filter(const nlohmann::json& params) {
  if (const auto single = params.find("interface"); single != params.end()) {
    if (!single->is_string()) {
      throw JsonRpcException(kInvalidParams, "interface must be a string");
    }
    return query::InterfaceFilter::single(single->get<std::string>());
  }

  if (const auto list = params.find("interfaces"); list != params.end()) {
    if (!list->is_array()) {
      throw JsonRpcException(kInvalidParams, "interfaces must be an array of strings");
    }
    std::set<model::InterfaceId> ids;
    for (const auto& id : *list) {
      if (!id.is_string()) {
        throw JsonRpcException(kInvalidParams, "interfaces must be an array of strings");
      }
      ids.insert(id.get<std::string>());
    }
    return query::InterfaceFilter::selected(std::move(ids));
  }

  if (const auto physical = params.find("physical_only"); physical != params.end() && physical->is_boolean() &&
                                                           physical->get<bool>()) {
    return query::InterfaceFilter::physical();
  }
  return query::InterfaceFilter::all();
}

nlohmann::json point_to_json(const query::QueryPoint& point) {
  return nlohmann::json{{"start", point.bucket_start_ms},
                        {"end", point.bucket_end_ms},
                        {"bytes_down", point.bytes_down},
                        {"bytes_up", point.bytes_up},
                        {"mean_rate_down_bps", point.mean_rate_down_bps()},
                        {"mean_rate_up_bps", point.mean_rate_up_bps()},
                        {"peak_rate_down_bps", point.peak_rate_down_bps},
                        {"peak_rate_up_bps", point.peak_rate_up_bps},
                        {"samples", point.sample_count},
                        {"downsampled", point.is_downsampled}};
}

nlohmann::json interface_to_json(const query::InterfaceInfo& info, const std::vector<std::string>& keywords) {
  return nlohmann::json{{"id", info.id},
                        {"name", info.name},
                        {"description", info.description},
                        {"first_seen", info.first_seen_ms},
                        {"last_seen", info.last_seen_ms},
                        {"active", info.active},
                        {"virtual", query::is_virtual_interface(info.id, keywords)}};
}

nlohmann::json handle_history(query::QueryEngine& engine, const core::Clock& clock, const nlohmann::json& params) {
  const auto range = parse_range(params, clock);

  std::size_t max_points = kDefaultMaxPoints;
  if (const auto max_it = params.find("max_points"); max_it != params.end()) {
    if (!max_it->is_number_unsigned()) {
      throw JsonRpcException(kInvalidParams, "max_points must be a non-negative integer");
    }
    max_points = max_it->get<std::size_t>();
  }

  const auto response = engine.run(query::QueryRequest{
      .filter = parse_filter(params), .range_start_ms = range.from_ms, .range_end_ms = range.to_ms, .max_points = max_points});

  nlohmann::json points = nlohmann::json::array();
  for (const auto& point : response.points) {
    points.push_back(point_to_json(point));
  }

  return nlohmann::json{{"tool", "throughput.history"},
                        {"from", range.from_ms},
                        {"to", range.to_ms},
                        {"tier", model::to_string(response.tier)},
                        {"history_available", response.history_available},
                        {"stats",
                         {{"total_down", response.stats.total_down},
                          {"total_up", response.stats.total_up},
                          {"peak_rate_down_bps", response.stats.peak_rate_down_bps},
                          {"peak_rate_up_bps", response.stats.peak_rate_up_bps}}},
                        {"points", points}};
}

nlohmann::json handle_export(query::QueryEngine& engine, const core::Clock& clock, const nlohmann::json& params) {
  const auto range = parse_range(params, clock);
  const auto response = engine.export_range(parse_filter(params), range.from_ms, range.to_ms);
  if (!response.history_available) {
    throw JsonRpcException(kStoreUnavailable, "history store is not available");
  }

  nlohmann::json result{{"tool", "throughput.export"},
                        {"from", range.from_ms},
                        {"to", range.to_ms},
                        {"tier", model::to_string(response.tier)},
                        {"rows", response.points.size()}};

  const auto path_it = params.find("path");
  if (path_it != params.end()) {
    if (!path_it->is_string()) {
      throw JsonRpcException(kInvalidParams, "path must be a string");
    }
    try {
      query::export_csv(path_it->get<std::string>(), response);
    } catch (const std::runtime_error& ex) {
      throw JsonRpcException(kInternalError, ex.what());
    }
    result["path"] = *path_it;
    return result;
  }

  std::ostringstream csv;
  query::write_csv(csv, response);
  result["csv"] = csv.str();
  return result;
}

nlohmann::json handle_interfaces(query::QueryEngine& engine, const std::vector<std::string>& keywords) {
  nlohmann::json interfaces = nlohmann::json::array();
  for (const auto& info : engine.interfaces()) {
    interfaces.push_back(interface_to_json(info, keywords));
  }
  return nlohmann::json{{"tool", "interfaces.list"}, {"interfaces", interfaces}};
}

nlohmann::json range_schema(nlohmann::json extra) {
  nlohmann::json properties{{"window", {{"type", "string"}}},
                            {"from", {{"type", "integer"}}},
                            {"to", {{"type", "integer"}}},
                            {"interface", {{"type", "string"}}},
                            {"interfaces", {{"type", "array"}, {"items", {{"type", "string"}}}}},
                            {"physical_only", {{"type", "boolean"}}}};
  properties.update(extra);
  return nlohmann::json{{"type", "object"}, {"properties", properties}, {"additionalProperties", false}};
}

}  // namespace

ToolRegistry build_tool_registry(std::shared_ptr<query::QueryEngine> engine, core::Clock clock) {
  if (!clock) {
    clock = core::system_clock_source();
  }
  const std::vector<std::string> keywords = engine->options().virtual_keywords;

  ToolRegistry registry;

  Tool history{.name = "throughput.history",
               .description = "Download/upload totals and rates over a time range, from the tier matching its span.",
               .input_schema = range_schema({{"max_points", {{"type", "integer"}, {"minimum", 0}}}}),
               .handler = [engine, clock](const nlohmann::json& params) { return handle_history(*engine, clock, params); }};

  Tool export_tool{.name = "throughput.export",
                   .description = "Export a time range at full tier resolution as CSV, inline or to a file path.",
                   .input_schema = range_schema({{"path", {{"type", "string"}}}}),
                   .handler = [engine, clock](const nlohmann::json& params) { return handle_export(*engine, clock, params); }};

  Tool interfaces{.name = "interfaces.list",
                  .description = "Network interfaces recorded in the history store.",
                  .input_schema = nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}},
                  .handler = [engine, keywords](const nlohmann::json&) { return handle_interfaces(*engine, keywords); }};

  registry.emplace(history.name, std::move(history));
  registry.emplace(export_tool.name, std::move(export_tool));
  registry.emplace(interfaces.name, std::move(interfaces));
  return registry;
}

ResourceRegistry build_resource_registry(std::shared_ptr<query::QueryEngine> engine) {
  ResourceRegistry registry;

  Resource status{.uri = "netspeed://store/status",
                  .name = "Store Status",
                  .description = "Schema version, rollup watermarks and row counts of the history store.",
                  .reader = [engine] {
                    const auto info = engine->store_info();
                    return nlohmann::json{{"available", info.available},
                                          {"schema_version", info.schema_version},
                                          {"minute_watermark", info.minute_watermark_ms},
                                          {"hour_watermark", info.hour_watermark_ms},
                                          {"rows",
                                           {{"raw", info.raw_rows}, {"minute", info.minute_rows}, {"hour", info.hour_rows}}}};
                  }};

  Resource tiers{.uri = "netspeed://store/tiers",
                 .name = "Tier Selection",
                 .description = "Span thresholds used to pick the raw, minute or hour tier for a query.",
                 .reader = [engine] {
                   const auto& options = engine->options();
                   return nlohmann::json{{"raw_max_span_ms", options.raw_span_threshold.count()},
                                         {"minute_max_span_ms", options.minute_span_threshold.count()},
                                         {"minute_bucket_ms", model::kMinuteBucketMs},
                                         {"hour_bucket_ms", model::kHourBucketMs}};
                 }};

  registry.emplace(status.uri, std::move(status));
  registry.emplace(tiers.uri, std::move(tiers));
  return registry;
}

std::shared_ptr<query::QueryEngine> make_engine_from_env() {
  query::QueryOptions options{};
  const auto raw_span = getenv_or("NETSPEED_RAW_SPAN", "");
  if (!raw_span.empty()) {
    options.raw_span_threshold = core::parse_duration_ms(raw_span);
  }
  const auto minute_span = getenv_or("NETSPEED_MINUTE_SPAN", "");
  if (!minute_span.empty()) {
    options.minute_span_threshold = core::parse_duration_ms(minute_span);
  }
  return std::make_shared<query::QueryEngine>(getenv_or("NETSPEED_STORE_PATH", "netspeed.db"), options);
}

}  // namespace netspeed::mcp
