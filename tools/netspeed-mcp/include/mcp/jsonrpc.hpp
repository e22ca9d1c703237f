#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace netspeed::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
// Implementation-defined server error range.
constexpr int kStoreUnavailable = -32001;

struct JsonRpcError {
  int code;
  std::string message;
};

// Thrown by request parsing and tool handlers; the server turns it into an
// error response carrying the same code.
class JsonRpcException : public std::runtime_error {
 public:
  JsonRpcException(int code, const std::string& message) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] int code() const noexcept { return code_; }
  [[nodiscard]] JsonRpcError error() const { return JsonRpcError{.code = code_, .message = what()}; }

 private:
  int code_;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  // Absent for notifications.
  std::optional<nlohmann::json> id;
};

JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace netspeed::mcp
