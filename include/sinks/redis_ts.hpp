#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "model/sample.hpp"

struct redisContext;

namespace netspeed::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"netspeed"};
  std::uint32_t connect_timeout_ms{1000};
};

// Mirrors live per-interface rates into RedisTimeSeries as
// <prefix>:<interface>:rate_down and <prefix>:<interface>:rate_up.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const std::vector<model::LiveRate>& rates);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_series(const std::string& key);
  bool publish_impl(const std::vector<model::LiveRate>& rates);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  std::unordered_set<std::string> created_series_{};
  bool timeseries_available_{true};
};

}  // namespace netspeed::sinks
