#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "core/bounded_queue.hpp"
#include "core/timestamp.hpp"
#include "model/sample.hpp"
#include "storage/retention.hpp"
#include "storage/tiered_store.hpp"

namespace netspeed::storage {

struct WriterOptions {
  std::size_t batch_size{256};
  std::chrono::milliseconds flush_interval{1000};
  std::chrono::milliseconds maintenance_interval{60'000};
  std::chrono::milliseconds initial_backoff{250};
  std::chrono::milliseconds max_backoff{8000};
  // Consecutive failed attempts before falling back to live-tail-only mode.
  std::uint32_t degrade_after_failures{5};
  std::chrono::milliseconds recovery_interval{30'000};
};

enum class NoticeKind : std::uint8_t {
  STORE_RECREATED = 0,
  STORE_DEGRADED = 1,
  STORE_RECOVERED = 2,
};

// User-facing, one-time messages about durability.
struct Notice {
  NoticeKind kind{NoticeKind::STORE_DEGRADED};
  std::string message{};
  std::int64_t at_ms{0};
};

struct WriterStats {
  std::uint64_t items_written{0};
  std::uint64_t batches_written{0};
  std::uint64_t write_failures{0};
  std::uint64_t items_lost{0};
  std::uint64_t rollups{0};
  std::uint64_t prunes{0};
  bool degraded{false};
};

using IngestQueue = core::BoundedQueue<model::IngestItem>;
using NoticeChannel = core::BoundedQueue<Notice>;

// Background drain of the ingestion queue into the tiered store, plus periodic
// rollup/prune. Owns the store's write connection for its whole lifetime.
class StoreWriter {
 public:
  StoreWriter(StoreOptions store_options, WriterOptions options, TierTtls configured_ttls,
              std::chrono::milliseconds grace_period, IngestQueue& queue, NoticeChannel& notices, core::Clock clock);
  ~StoreWriter();

  StoreWriter(const StoreWriter&) = delete;
  StoreWriter& operator=(const StoreWriter&) = delete;

  void start();
  // The owner closes the queue first; the thread drains what is left, runs a
  // final rollup and exits.
  void stop();

  // Applied at the next maintenance pass under the grace-period rule.
  void request_retention(const TierTtls& ttls);

  [[nodiscard]] WriterStats stats() const;

 private:
  void run(std::stop_token st);
  bool open_store();
  void write(std::vector<model::IngestItem>& batch, std::stop_token st);
  bool try_write(const std::vector<model::IngestItem>& batch);
  void maintain(std::int64_t now_ms);
  void enter_degraded(const std::string& reason);
  void leave_degraded();
  void post_notice(NoticeKind kind, const std::string& message);
  bool wait_for(std::chrono::milliseconds delay, std::stop_token st);

  StoreOptions store_options_;
  WriterOptions options_;
  TierTtls configured_ttls_;
  std::chrono::milliseconds grace_period_;
  IngestQueue& queue_;
  NoticeChannel& notices_;
  core::Clock clock_;

  std::unique_ptr<TieredStore> store_{};
  RetentionPolicy policy_{};
  std::int64_t last_maintenance_ms_{0};
  std::int64_t last_probe_ms_{0};
  std::uint32_t consecutive_failures_{0};

  mutable std::mutex mutex_;
  std::optional<std::pair<TierTtls, std::int64_t>> requested_retention_{};
  WriterStats stats_{};

  std::mutex wait_mutex_;
  std::condition_variable_any wait_cv_;
  std::jthread thread_;
};

}  // namespace netspeed::storage
