#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"
#include "query/query_engine.hpp"

namespace netspeed::mcp {

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using ToolRegistry = std::unordered_map<std::string, Tool>;

struct Resource {
  std::string uri;
  std::string name;
  std::string description;
  std::function<nlohmann::json()> reader;
};

// Ordered so resources/list is stable.
using ResourceRegistry = std::map<std::string, Resource>;

ToolRegistry build_tool_registry(std::shared_ptr<query::QueryEngine> engine, core::Clock clock = {});
ResourceRegistry build_resource_registry(std::shared_ptr<query::QueryEngine> engine);

// Store location and thresholds from NETSPEED_* environment variables.
std::shared_ptr<query::QueryEngine> make_engine_from_env();

}  // namespace netspeed::mcp
