#include "mcp/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "mcp/jsonrpc.hpp"

namespace netspeed::mcp {

Server::Server(ToolRegistry tools, ResourceRegistry resources)
    : tools_(std::move(tools)), resources_(std::move(resources)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    try {
      const auto response = handle_line(line);
      if (!response.is_null()) {
        out << response.dump() << '\n';
        out.flush();
      }
    } catch (const std::exception& ex) {
      err << "netspeed-mcp: failed to process request: " << ex.what() << '\n';
      out << make_error_response(nullptr, JsonRpcError{.code = kInternalError, .message = "internal error"}).dump()
          << '\n';
      out.flush();
    }
  }

  return 0;
}

nlohmann::json Server::handle_line(const std::string& line) const {
  const auto request = nlohmann::json::parse(line, nullptr, false);
  if (request.is_discarded()) {
    return make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "parse error"});
  }
  return handle_request(request);
}

nlohmann::json Server::handle_request(const nlohmann::json& request) const {
  nlohmann::json id = nullptr;
  bool notification = false;
  try {
    const auto parsed = parse_request(request);
    notification = !parsed.id.has_value();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }

    auto result = dispatch(parsed.method, parsed.params);
    if (notification) {
      return {};
    }
    return make_result_response(id, result);
  } catch (const JsonRpcException& ex) {
    if (notification) {
      return {};
    }
    return make_error_response(id, ex.error());
  } catch (const std::invalid_argument& ex) {
    if (notification) {
      return {};
    }
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  } catch (const std::out_of_range& ex) {
    if (notification) {
      return {};
    }
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  }
}

nlohmann::json Server::dispatch(const std::string& method, const nlohmann::json& params) const {
  if (method == "initialize") {
    return handle_initialize(params);
  }
  if (method == "notifications/initialized") {
    return nlohmann::json::object();
  }
  if (method == "tools/list") {
    return handle_tools_list();
  }
  if (method == "tools/call") {
    return handle_tools_call(params);
  }
  if (method == "resources/list") {
    return handle_resources_list();
  }
  if (method == "resources/read") {
    return handle_resources_read(params);
  }
  throw JsonRpcException(kMethodNotFound, "method not found: " + method);
}

nlohmann::json Server::handle_initialize(const nlohmann::json& /*params*/) const {
  return nlohmann::json{{"serverInfo", {{"name", "netspeed-mcp"}, {"version", "0.1.0"}}},
                        {"capabilities",
                         {{"tools", nlohmann::json::object()}, {"resources", nlohmann::json::object()}}}};
}

nlohmann::json Server::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& [_, tool] : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& params) const {
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw JsonRpcException(kInvalidParams, "name must be a string");
  }

  nlohmann::json arguments = nlohmann::json::object();
  if (const auto args_it = params.find("arguments"); args_it != params.end()) {
    if (!args_it->is_object()) {
      throw JsonRpcException(kInvalidParams, "arguments must be an object");
    }
    arguments = *args_it;
  }

  const auto tool_it = tools_.find(name_it->get<std::string>());
  if (tool_it == tools_.end()) {
    throw JsonRpcException(kInvalidParams, "unknown tool: " + name_it->get<std::string>());
  }

  return nlohmann::json{{"content", tool_it->second.handler(arguments)}};
}

nlohmann::json Server::handle_resources_list() const {
  nlohmann::json resources = nlohmann::json::array();
  for (const auto& [uri, resource] : resources_) {
    resources.push_back({{"uri", uri}, {"name", resource.name}, {"description", resource.description}});
  }
  return nlohmann::json{{"resources", resources}};
}

nlohmann::json Server::handle_resources_read(const nlohmann::json& params) const {
  const auto uri_it = params.find("uri");
  if (uri_it == params.end() || !uri_it->is_string()) {
    throw JsonRpcException(kInvalidParams, "uri must be a string");
  }

  const auto& uri = uri_it->get_ref<const std::string&>();
  const auto resource = resources_.find(uri);
  if (resource == resources_.end()) {
    throw JsonRpcException(kInvalidParams, "unknown resource uri: " + uri);
  }
  return nlohmann::json{{"uri", uri}, {"contents", resource->second.reader()}};
}

}  // namespace netspeed::mcp
