#include "core/agent.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace netspeed::core {
namespace {

constexpr std::chrono::milliseconds kSinkPollInterval{500};

}  // namespace

Agent::Agent(AgentConfig config, std::unique_ptr<sensors::CounterSource> source, Clock clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : system_clock_source()),
      source_(source != nullptr ? std::move(source)
                                : std::make_unique<sensors::SysfsCounterSource>(config_.interfaces.sysfs_root,
                                                                                config_.interfaces.include_loopback)),
      sampler_(config_.sampler),
      guard_(config_.guard),
      live_tail_(config_.live_tail_capacity),
      queue_(config_.queue_capacity),
      notices_(64),
      writer_(config_.store, config_.writer, config_.retention, config_.retention_grace, queue_, notices_, clock_),
      query_engine_(config_.store.path, config_.query, &live_tail_) {
  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.password = config_.redis.password;
    options.db = config_.redis.db;
    options.key_prefix = config_.redis.key_prefix;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string address =
        !options.unix_socket.empty() ? "unix://" + options.unix_socket : options.host + ':' + std::to_string(options.port);
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[agent] redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[agent] redis connectivity check failed at " << address << '\n';
    }
  }
}

Agent::~Agent() { stop(); }

void Agent::start(const bool run_sampler) {
  if (started_) {
    return;
  }
  started_ = true;

  writer_.start();
  if (config_.stdout_debug || redis_sink_ != nullptr) {
    sink_channel_ = subscribe_rates();
    sink_thread_ = std::jthread([this](std::stop_token st) { sink_loop(st); });
  }
  if (run_sampler) {
    sampler_thread_ = std::jthread([this](std::stop_token st) { sampling_loop(st); });
  }
}

// Sampler first, so nothing is produced into a closed queue; then the writer
// drains what is left.
void Agent::stop() {
  if (!started_) {
    return;
  }
  started_ = false;

  if (sampler_thread_.joinable()) {
    sampler_thread_.request_stop();
    sampler_thread_.join();
  }

  writer_.stop();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& subscriber : subscribers_) {
      subscriber->close();
    }
    subscribers_.clear();
  }
  if (sink_thread_.joinable()) {
    sink_thread_.request_stop();
    sink_thread_.join();
  }
}

void Agent::tick_once() {
  const auto compute_start = monotonic_timestamp_now_ns();

  sensors::CounterSnapshot snapshot;
  if (!source_->poll(snapshot)) {
    sampler_.skip_tick();
    if (source_was_ok_) {
      std::cerr << "[agent] counter poll failed; skipping tick\n";
      source_was_ok_ = false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.ticks_executed;
    ++stats_.failed_polls;
    stats_.sampling_interval = sampler_.interval();
    return;
  }
  if (!source_was_ok_) {
    std::cerr << "[agent] counter poll recovered\n";
    source_was_ok_ = true;
  }

  const std::int64_t now_ms = clock_();
  SamplerOutput output = sampler_.tick(snapshot, now_ms);

  for (auto& update : output.interface_updates) {
    if (!update.active) {
      guard_.forget(update.interface_id);
    }
    queue_.push(std::move(update));
  }

  std::size_t discontinuities = output.discontinuities.size();
  for (auto& discontinuity : output.discontinuities) {
    queue_.push(std::move(discontinuity));
  }

  std::vector<model::LiveRate> rates;
  rates.reserve(output.samples.size());
  std::size_t accepted = 0;
  std::size_t discarded = 0;
  std::vector<model::Discontinuity> guard_markers;
  for (auto& sample : output.samples) {
    guard_markers.clear();
    if (guard_.evaluate(sample, guard_markers) == guard::GuardDecision::DISCARD) {
      ++discarded;
      discontinuities += guard_markers.size();
      for (auto& marker : guard_markers) {
        queue_.push(std::move(marker));
      }
      continue;
    }

    ++accepted;
    live_tail_.push(sample);
    rates.push_back(model::LiveRate{.interface_id = sample.interface_id,
                                    .rate_down_bps = sample.rate_down_bps(),
                                    .rate_up_bps = sample.rate_up_bps(),
                                    .timestamp_ms = sample.interval_end_ms});
    queue_.push(std::move(sample));
  }

  if (!rates.empty()) {
    broadcast(rates);
  }

  const auto compute_ns = monotonic_timestamp_now_ns() - compute_start;
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.ticks_executed;
  stats_.samples_accepted += accepted;
  stats_.samples_discarded += discarded;
  stats_.discontinuities += discontinuities;
  stats_.known_interfaces = sampler_.registry().size();
  stats_.sampling_interval = sampler_.interval();
  stats_.last_tick_compute_ms = static_cast<float>(compute_ns) / 1'000'000.0F;
}

std::shared_ptr<RateChannel> Agent::subscribe_rates() {
  auto channel = std::make_shared<RateChannel>(config_.subscriber_capacity);
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.push_back(channel);
  return channel;
}

void Agent::set_retention(const storage::TierTtls& ttls) { writer_.request_retention(ttls); }

std::future<query::QueryResponse> Agent::query(query::QueryRequest request) {
  return query_engine_.submit(std::move(request));
}

query::QueryResponse Agent::export_range(const query::InterfaceFilter& filter, const std::int64_t range_start_ms,
                                         const std::int64_t range_end_ms) {
  return query_engine_.export_range(filter, range_start_ms, range_end_ms);
}

std::vector<storage::Notice> Agent::take_notices() {
  std::vector<storage::Notice> out;
  while (auto notice = notices_.try_pop()) {
    out.push_back(std::move(*notice));
  }
  return out;
}

AgentDiagnostics Agent::diagnostics() const {
  AgentDiagnostics diagnostics{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics.agent = stats_;
    for (const auto& subscriber : subscribers_) {
      diagnostics.rate_updates_dropped += subscriber->dropped();
    }
  }
  diagnostics.writer = writer_.stats();
  diagnostics.queue_depth = queue_.size();
  diagnostics.queue_dropped = queue_.dropped();
  diagnostics.live_tail_samples = live_tail_.size();
  return diagnostics;
}

void Agent::sampling_loop(std::stop_token st) {
  auto next_wakeup = std::chrono::steady_clock::now();
  while (!st.stop_requested()) {
    tick_once();

    next_wakeup += sampler_.interval();
    const auto now = std::chrono::steady_clock::now();
    if (next_wakeup < now) {
      next_wakeup = now;
    }

    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_until(lock, st, next_wakeup, [] { return false; });
  }
}

void Agent::sink_loop(std::stop_token st) {
  std::vector<std::vector<model::LiveRate>> pending;
  while (!st.stop_requested() && !sink_channel_->finished()) {
    pending.clear();
    sink_channel_->pop_batch(pending, sink_channel_->capacity(), kSinkPollInterval);
    for (const auto& rates : pending) {
      publish_sinks(rates);
    }
  }
}

void Agent::broadcast(const std::vector<model::LiveRate>& rates) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& subscriber : subscribers_) {
    subscriber->push(rates);
  }
}

void Agent::publish_sinks(const std::vector<model::LiveRate>& rates) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.sink_cycles;
  }

  if (config_.stdout_debug) {
    stdout_sink_.publish(rates);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(rates);
    if (!ok) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.redis_errors;
    }
    if (!ok && redis_was_ok_) {
      std::cerr << "[redis] publish failed\n";
      redis_was_ok_ = false;
    } else if (ok && !redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

}  // namespace netspeed::core
