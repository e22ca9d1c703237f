#include "sinks/redis_ts.hpp"

#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace netspeed::sinks {
namespace {

double sanitize_value(const double value) { return std::isfinite(value) && value >= 0.0 ? value : 0.0; }

void add_metric_args(std::vector<std::string>& args, const std::string& key, const std::int64_t timestamp_ms,
                     const double value) {
  args.emplace_back(key);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();
  created_series_.clear();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

// Interfaces come and go, so series are created the first time a key is seen
// on the current connection.
bool RedisTsSink::ensure_series(const std::string& key) {
  if (created_series_.find(key) != created_series_.end()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST LABELS source netspeed", key.c_str()));
  if (reply == nullptr) {
    return false;
  }

  const bool already_exists =
      reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
  const bool unknown_command =
      reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
  const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
  const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
  freeReplyObject(reply);

  if (unknown_command) {
    std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
    timeseries_available_ = false;
    return false;
  }
  if (!ok) {
    std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
    return false;
  }

  created_series_.insert(key);
  return true;
}

bool RedisTsSink::publish(const std::vector<model::LiveRate>& rates) {
  if (rates.empty()) {
    return true;
  }
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(rates)) {
    return true;
  }

  if (!timeseries_available_ || !reconnect()) {
    return false;
  }
  return publish_impl(rates);
}

bool RedisTsSink::publish_impl(const std::vector<model::LiveRate>& rates) {
  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.reserve(1 + rates.size() * 6);
  command_args_.emplace_back("TS.MADD");

  for (const auto& rate : rates) {
    const std::string base = options_.key_prefix + ":" + rate.interface_id;
    const std::string down_key = base + ":rate_down";
    const std::string up_key = base + ":rate_up";
    if (!ensure_series(down_key) || !ensure_series(up_key)) {
      return false;
    }
    add_metric_args(command_args_, down_key, rate.timestamp_ms, sanitize_value(rate.rate_down_bps));
    add_metric_args(command_args_, up_key, rate.timestamp_ms, sanitize_value(rate.rate_up_bps));
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] TS.MADD failed: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace netspeed::sinks
