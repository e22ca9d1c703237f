#include <exception>
#include <iostream>

#include "mcp/server.hpp"
#include "mcp/tools.hpp"

int main() {
  try {
    const auto engine = netspeed::mcp::make_engine_from_env();
    netspeed::mcp::Server server(netspeed::mcp::build_tool_registry(engine),
                                 netspeed::mcp::build_resource_registry(engine));
    return server.run(std::cin, std::cout, std::cerr);
  } catch (const std::exception& ex) {
    std::cerr << "netspeed-mcp: " << ex.what() << '\n';
    return 1;
  }
}
