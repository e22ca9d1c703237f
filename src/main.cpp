#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "core/agent.hpp"
#include "core/config.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

constexpr std::chrono::milliseconds kNoticePollInterval{250};

}  // namespace

std::string format_config_settings(const netspeed::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | store=" << config.store.path
         << " | sampler_interval_ms=" << config.sampler.min_interval.count() << ".." << config.sampler.max_interval.count()
         << " | retention_raw_h=" << std::chrono::duration_cast<std::chrono::hours>(config.retention.raw).count()
         << " | retention_minute_h=" << std::chrono::duration_cast<std::chrono::hours>(config.retention.minute).count()
         << " | retention_hour_h=" << std::chrono::duration_cast<std::chrono::hours>(config.retention.hour).count()
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/netspeed.yaml";

  netspeed::core::AgentConfig config{};
  try {
    config = netspeed::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  netspeed::core::Agent agent{config};
  agent.start();
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(kNoticePollInterval);
    for (const auto& notice : agent.take_notices()) {
      std::cerr << "[notice] " << notice.message << '\n';
    }
  }

  std::cerr << "[agent] shutdown signal received; draining history writer\n";
  agent.stop();
  for (const auto& notice : agent.take_notices()) {
    std::cerr << "[notice] " << notice.message << '\n';
  }

  const auto diagnostics = agent.diagnostics();
  std::cerr << "[agent] ticks=" << diagnostics.agent.ticks_executed
            << " accepted=" << diagnostics.agent.samples_accepted
            << " discarded=" << diagnostics.agent.samples_discarded
            << " written=" << diagnostics.writer.items_written
            << " queue_dropped=" << diagnostics.queue_dropped
            << " lost=" << diagnostics.writer.items_lost << '\n';
  return 0;
}
