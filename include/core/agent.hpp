#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "core/bounded_queue.hpp"
#include "core/config.hpp"
#include "core/live_tail.hpp"
#include "core/sampler.hpp"
#include "core/timestamp.hpp"
#include "guard/spike_guard.hpp"
#include "query/query_engine.hpp"
#include "sensors/counter_source.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "storage/writer.hpp"

namespace netspeed::core {

// One entry per sampler tick that produced accepted samples.
using RateChannel = BoundedQueue<std::vector<model::LiveRate>>;

struct AgentStats {
  std::size_t ticks_executed{0};
  std::size_t failed_polls{0};
  std::size_t samples_accepted{0};
  std::size_t samples_discarded{0};
  std::size_t discontinuities{0};
  std::size_t sink_cycles{0};
  std::size_t redis_errors{0};
  std::size_t known_interfaces{0};
  std::chrono::milliseconds sampling_interval{0};
  float last_tick_compute_ms{0.0F};
};

struct AgentDiagnostics {
  AgentStats agent{};
  storage::WriterStats writer{};
  std::size_t queue_depth{0};
  std::uint64_t queue_dropped{0};
  std::uint64_t rate_updates_dropped{0};
  std::size_t live_tail_samples{0};
};

// Owns the pipeline: counter source -> sampler -> spike guard -> ingestion
// queue -> store writer, with the live tail and rate channels fed alongside.
class Agent {
 public:
  explicit Agent(AgentConfig config = {}, std::unique_ptr<sensors::CounterSource> source = nullptr, Clock clock = {});
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Starts the writer and sink threads; the sampling thread only when
  // run_sampler is set, so callers can drive tick_once() themselves.
  void start(bool run_sampler = true);
  void stop();

  // One poll/delta/guard pass. Must only be called from a single thread.
  void tick_once();

  [[nodiscard]] std::shared_ptr<RateChannel> subscribe_rates();
  void set_retention(const storage::TierTtls& ttls);
  [[nodiscard]] std::future<query::QueryResponse> query(query::QueryRequest request);
  query::QueryResponse export_range(const query::InterfaceFilter& filter, std::int64_t range_start_ms,
                                    std::int64_t range_end_ms);
  std::vector<storage::Notice> take_notices();
  [[nodiscard]] AgentDiagnostics diagnostics() const;

 private:
  void sampling_loop(std::stop_token st);
  void sink_loop(std::stop_token st);
  void broadcast(const std::vector<model::LiveRate>& rates);
  void publish_sinks(const std::vector<model::LiveRate>& rates);

  AgentConfig config_;
  Clock clock_;
  std::unique_ptr<sensors::CounterSource> source_;
  Sampler sampler_;
  guard::SpikeGuard guard_;
  LiveTail live_tail_;
  storage::IngestQueue queue_;
  storage::NoticeChannel notices_;
  storage::StoreWriter writer_;
  query::QueryEngine query_engine_;

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  std::shared_ptr<RateChannel> sink_channel_{};
  bool redis_was_ok_{true};
  bool source_was_ok_{true};

  mutable std::mutex mutex_;
  AgentStats stats_{};
  std::vector<std::shared_ptr<RateChannel>> subscribers_{};

  std::mutex wait_mutex_;
  std::condition_variable_any wait_cv_;
  std::jthread sampler_thread_;
  std::jthread sink_thread_;
  bool started_{false};
};

}  // namespace netspeed::core
