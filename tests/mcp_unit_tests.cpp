#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "mcp/jsonrpc.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "storage/tiered_store.hpp"

using netspeed::mcp::Server;
using netspeed::model::Sample;
using netspeed::model::InterfaceUpdate;
using netspeed::query::QueryEngine;
using netspeed::query::QueryOptions;
using netspeed::storage::StoreOptions;
using netspeed::storage::TieredStore;

namespace {

constexpr std::int64_t kT0 = 1'699'999'200'000LL;

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

void remove_store_files(const std::filesystem::path& path) {
  std::error_code ec;
  const std::string prefix = path.filename().string();
  for (const auto& entry : std::filesystem::directory_iterator(path.parent_path(), ec)) {
    if (entry.path().filename().string().rfind(prefix, 0) == 0) {
      std::filesystem::remove(entry.path(), ec);
    }
  }
}

Server make_server(const std::string& store_path) {
  auto engine = std::make_shared<QueryEngine>(store_path, QueryOptions{});
  return Server(netspeed::mcp::build_tool_registry(engine, [] { return kT0 + 10'000; }),
                netspeed::mcp::build_resource_registry(engine));
}

nlohmann::json call(const Server& server, const std::string& method, const nlohmann::json& params) {
  const nlohmann::json request{{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}, {"params", params}};
  return server.handle_line(request.dump());
}

int error_code(const nlohmann::json& response) {
  if (!response.contains("error")) {
    return 0;
  }
  return response["error"]["code"].get<int>();
}

int test_protocol_envelope() {
  const Server server = make_server("/nonexistent-netspeed-dir/history.db");

  const auto init = call(server, "initialize", nlohmann::json::object());
  if (init["result"]["serverInfo"]["name"] != "netspeed-mcp" || init["id"] != 1) {
    return fail("test_protocol_envelope", "initialize should identify the server");
  }

  const auto tools = call(server, "tools/list", nlohmann::json::object());
  if (tools["result"]["tools"].size() != 3) {
    return fail("test_protocol_envelope", "expected three tools");
  }

  if (error_code(call(server, "metrics/summary", nlohmann::json::object())) != netspeed::mcp::kMethodNotFound) {
    return fail("test_protocol_envelope", "unknown method should be rejected");
  }
  if (error_code(server.handle_line("{not json")) != netspeed::mcp::kParseError) {
    return fail("test_protocol_envelope", "malformed json should be a parse error");
  }
  if (!server.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").is_null()) {
    return fail("test_protocol_envelope", "notifications get no response");
  }

  const auto unknown_tool = call(server, "tools/call", {{"name", "cpu.load"}});
  if (error_code(unknown_tool) != netspeed::mcp::kInvalidParams) {
    return fail("test_protocol_envelope", "unknown tool should be invalid params");
  }

  return 0;
}

int test_history_and_export_tools() {
  const auto path = std::filesystem::temp_directory_path() / ("netspeed_mcp_" + std::to_string(::getpid()) + ".db");
  remove_store_files(path);
  {
    TieredStore store(StoreOptions{.path = path.string()});
    (void)store.insert_batch({InterfaceUpdate{.interface_id = "eth0", .name = "eth0", .seen_at_ms = kT0},
                              Sample{.interface_id = "eth0",
                                     .interval_start_ms = kT0,
                                     .interval_end_ms = kT0 + 5000,
                                     .bytes_down = 5000,
                                     .bytes_up = 1000}});
  }

  const Server server = make_server(path.string());

  const auto history = call(server, "tools/call", {{"name", "throughput.history"}, {"arguments", {{"window", "1m"}}}});
  const auto& content = history["result"]["content"];
  if (content["tier"] != "raw" || content["stats"]["total_down"] != 5000 || content["points"].size() != 1) {
    return fail("test_history_and_export_tools", "history should return the stored sample");
  }
  if (content["points"][0]["mean_rate_down_bps"].get<double>() != 1000.0) {
    return fail("test_history_and_export_tools", "mean rate should be bytes over bucket duration");
  }

  const auto bad_window =
      call(server, "tools/call", {{"name", "throughput.history"}, {"arguments", {{"window", "5 parsecs"}}}});
  if (error_code(bad_window) != netspeed::mcp::kInvalidParams) {
    return fail("test_history_and_export_tools", "bad window should be invalid params");
  }

  const auto exported = call(server, "tools/call",
                             {{"name", "throughput.export"}, {"arguments", {{"from", kT0}, {"to", kT0 + 10'000}}}});
  const auto csv = exported["result"]["content"]["csv"].get<std::string>();
  if (exported["result"]["content"]["rows"] != 1 ||
      csv.rfind("bucket_start,bucket_end,bytes_down,bytes_up,download_mbps,upload_mbps\n", 0) != 0 ||
      csv.find(",5000,1000,0.008,0.002\n") == std::string::npos) {
    return fail("test_history_and_export_tools", "export should render csv inline");
  }

  const auto listed = call(server, "tools/call", {{"name", "interfaces.list"}});
  const auto& interfaces = listed["result"]["content"]["interfaces"];
  if (interfaces.size() != 1 || interfaces[0]["id"] != "eth0" || interfaces[0]["virtual"] != false) {
    return fail("test_history_and_export_tools", "interface listing mismatch");
  }

  const auto status = call(server, "resources/read", {{"uri", "netspeed://store/status"}});
  if (status["result"]["contents"]["available"] != true || status["result"]["contents"]["rows"]["raw"] != 1) {
    return fail("test_history_and_export_tools", "status resource should report row counts");
  }

  remove_store_files(path);

  const Server missing = make_server(path.string());
  const auto unavailable = call(missing, "tools/call",
                                {{"name", "throughput.export"}, {"arguments", {{"from", kT0}, {"to", kT0 + 10'000}}}});
  if (error_code(unavailable) != netspeed::mcp::kStoreUnavailable) {
    return fail("test_history_and_export_tools", "export without a store should report it unavailable");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_protocol_envelope(); rc != 0) return rc;
  if (int rc = test_history_and_export_tools(); rc != 0) return rc;

  std::cout << "[PASS] mcp unit tests\n";
  return 0;
}
