#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "core/sampler.hpp"
#include "guard/spike_guard.hpp"
#include "query/query_engine.hpp"
#include "storage/retention.hpp"
#include "storage/tiered_store.hpp"
#include "storage/writer.hpp"

namespace netspeed::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"netspeed"};
  bool enabled{false};
};

struct InterfaceSourceConfig {
  std::string sysfs_root{"/sys/class/net"};
  bool include_loopback{false};
};

struct AgentConfig {
  SamplerOptions sampler{};
  guard::SpikeGuardOptions guard{};
  std::size_t queue_capacity{4096};
  std::size_t live_tail_capacity{600};
  std::size_t subscriber_capacity{64};
  storage::StoreOptions store{};
  storage::WriterOptions writer{};
  storage::TierTtls retention{};
  std::chrono::milliseconds retention_grace{std::chrono::hours(48)};
  query::QueryOptions query{};
  InterfaceSourceConfig interfaces{};
  bool stdout_debug{false};
  RedisConfig redis{};
};

// Accepts "250ms", "30s", "15m", "24h", "30d" or a bare millisecond count.
std::chrono::milliseconds parse_duration_ms(const std::string& value);

AgentConfig load_agent_config(const std::string& path);

// Throws std::runtime_error naming the first inconsistent setting.
void validate_agent_config(const AgentConfig& config);

}  // namespace netspeed::core
