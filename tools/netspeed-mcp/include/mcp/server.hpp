#pragma once

#include <iosfwd>

#include "mcp/tools.hpp"

namespace netspeed::mcp {

// Line-delimited JSON-RPC 2.0 over a pair of streams.
class Server {
 public:
  Server(ToolRegistry tools, ResourceRegistry resources);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Empty json when the request was a notification.
  nlohmann::json handle_line(const std::string& line) const;

 private:
  nlohmann::json handle_request(const nlohmann::json& request) const;
  nlohmann::json dispatch(const std::string& method, const nlohmann::json& params) const;
  nlohmann::json handle_initialize(const nlohmann::json& params) const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params) const;
  nlohmann::json handle_resources_list() const;
  nlohmann::json handle_resources_read(const nlohmann::json& params) const;

  ToolRegistry tools_;
  ResourceRegistry resources_;
};

}  // namespace netspeed::mcp
