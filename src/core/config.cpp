#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace netspeed::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = lowercase(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::size_t parse_positive_size(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return static_cast<std::size_t>(parsed);
}

std::chrono::milliseconds parse_positive_duration(const std::string& key, const std::string& value) {
  const auto parsed = parse_duration_ms(value);
  if (parsed.count() <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = unquote(trim(item));
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "sampler.min_interval") {
    config.sampler.min_interval = parse_positive_duration(key, value);
    return;
  }
  if (key == "sampler.max_interval") {
    config.sampler.max_interval = parse_positive_duration(key, value);
    return;
  }
  if (key == "sampler.idle_ticks_before_backoff") {
    config.sampler.idle_ticks_before_backoff = static_cast<std::uint32_t>(parse_positive_size(key, value));
    return;
  }
  if (key == "sampler.inactive_after") {
    config.sampler.inactive_after = parse_duration_ms(value);
    return;
  }

  if (key == "guard.rate_ceiling_bps") {
    config.guard.rate_ceiling_bps = std::stod(value);
    return;
  }
  if (key == "guard.reprime_rate_ceiling_bps") {
    config.guard.reprime_rate_ceiling_bps = std::stod(value);
    return;
  }
  if (key == "guard.sleep_threshold") {
    config.guard.sleep_threshold = parse_positive_duration(key, value);
    return;
  }
  if (key == "guard.reprime_ticks") {
    config.guard.reprime_ticks = static_cast<std::uint32_t>(parse_positive_size(key, value));
    return;
  }

  if (key == "queue.capacity") {
    config.queue_capacity = parse_positive_size(key, value);
    return;
  }
  if (key == "live_tail.capacity") {
    config.live_tail_capacity = parse_positive_size(key, value);
    return;
  }
  if (key == "live_tail.subscriber_capacity") {
    config.subscriber_capacity = parse_positive_size(key, value);
    return;
  }

  if (key == "store.path") {
    config.store.path = value;
    return;
  }
  if (key == "store.finalization_delay") {
    config.store.finalization_delay = parse_duration_ms(value);
    return;
  }
  if (key == "store.busy_timeout") {
    config.store.busy_timeout_ms = static_cast<int>(parse_duration_ms(value).count());
    return;
  }
  if (key == "store.vacuum_after_prune") {
    config.store.vacuum_after_prune = parse_bool(value);
    return;
  }

  if (key == "writer.batch_size") {
    config.writer.batch_size = parse_positive_size(key, value);
    return;
  }
  if (key == "writer.flush_interval") {
    config.writer.flush_interval = parse_positive_duration(key, value);
    return;
  }
  if (key == "writer.maintenance_interval") {
    config.writer.maintenance_interval = parse_positive_duration(key, value);
    return;
  }
  if (key == "writer.initial_backoff") {
    config.writer.initial_backoff = parse_positive_duration(key, value);
    return;
  }
  if (key == "writer.max_backoff") {
    config.writer.max_backoff = parse_positive_duration(key, value);
    return;
  }
  if (key == "writer.degrade_after_failures") {
    config.writer.degrade_after_failures = static_cast<std::uint32_t>(parse_positive_size(key, value));
    return;
  }
  if (key == "writer.recovery_interval") {
    config.writer.recovery_interval = parse_positive_duration(key, value);
    return;
  }

  if (key == "retention.raw") {
    config.retention.raw = parse_positive_duration(key, value);
    return;
  }
  if (key == "retention.minute") {
    config.retention.minute = parse_positive_duration(key, value);
    return;
  }
  if (key == "retention.hour") {
    config.retention.hour = parse_positive_duration(key, value);
    return;
  }
  if (key == "retention.grace_period") {
    config.retention_grace = parse_duration_ms(value);
    return;
  }

  if (key == "query.raw_span_threshold") {
    config.query.raw_span_threshold = parse_positive_duration(key, value);
    return;
  }
  if (key == "query.minute_span_threshold") {
    config.query.minute_span_threshold = parse_positive_duration(key, value);
    return;
  }
  if (key == "query.virtual_keywords") {
    config.query.virtual_keywords = split_list(value);
    return;
  }

  if (key == "interfaces.sysfs_root") {
    config.interfaces.sysfs_root = value;
    return;
  }
  if (key == "interfaces.include_loopback") {
    config.interfaces.include_loopback = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }
  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }
  if (key == "redis.db") {
    config.redis.db = std::stoi(value);
    if (config.redis.db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    return;
  }
  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

std::chrono::milliseconds parse_duration_ms(const std::string& value) {
  const std::string text = lowercase(trim(value));
  std::size_t consumed = 0;
  const long long amount = std::stoll(text, &consumed);
  const std::string unit = trim(text.substr(consumed));

  if (unit.empty() || unit == "ms") {
    return std::chrono::milliseconds(amount);
  }
  if (unit == "s") {
    return std::chrono::seconds(amount);
  }
  if (unit == "m") {
    return std::chrono::minutes(amount);
  }
  if (unit == "h") {
    return std::chrono::hours(amount);
  }
  if (unit == "d") {
    return std::chrono::hours(amount * 24);
  }
  throw std::runtime_error("unknown duration unit in '" + value + "'");
}

void validate_agent_config(const AgentConfig& config) {
  if (config.sampler.min_interval > config.sampler.max_interval) {
    throw std::runtime_error("sampler.min_interval must not exceed sampler.max_interval");
  }
  if (config.guard.sleep_threshold <= config.sampler.max_interval) {
    throw std::runtime_error("guard.sleep_threshold must be greater than sampler.max_interval");
  }
  if (config.guard.reprime_rate_ceiling_bps <= 0.0 ||
      config.guard.reprime_rate_ceiling_bps > config.guard.rate_ceiling_bps) {
    throw std::runtime_error("guard.reprime_rate_ceiling_bps must be in range (0, rate_ceiling_bps]");
  }
  if (config.writer.initial_backoff > config.writer.max_backoff) {
    throw std::runtime_error("writer.initial_backoff must not exceed writer.max_backoff");
  }
  if (config.query.raw_span_threshold >= config.query.minute_span_threshold) {
    throw std::runtime_error("query.raw_span_threshold must be less than query.minute_span_threshold");
  }
  if (config.store.path.empty()) {
    throw std::runtime_error("store.path must not be empty");
  }
  if (config.retention_grace.count() < 0 || config.store.finalization_delay.count() < 0) {
    throw std::runtime_error("retention.grace_period and store.finalization_delay must not be negative");
  }
}

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    try {
      apply_key_value(config, full_key.str(), value);
    } catch (const std::invalid_argument&) {
      throw std::runtime_error(path + ":" + std::to_string(line_number) + ": invalid value for " + full_key.str());
    } catch (const std::out_of_range&) {
      throw std::runtime_error(path + ":" + std::to_string(line_number) + ": value out of range for " + full_key.str());
    }
  }

  validate_agent_config(config);
  return config;
}

}  // namespace netspeed::core
