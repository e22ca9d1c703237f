#include "storage/writer.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace netspeed::storage {

StoreWriter::StoreWriter(StoreOptions store_options, WriterOptions options, TierTtls configured_ttls,
                         const std::chrono::milliseconds grace_period, IngestQueue& queue, NoticeChannel& notices,
                         core::Clock clock)
    : store_options_(std::move(store_options)),
      options_(options),
      configured_ttls_(configured_ttls),
      grace_period_(grace_period),
      queue_(queue),
      notices_(notices),
      clock_(clock ? std::move(clock) : core::system_clock_source()) {}

StoreWriter::~StoreWriter() { stop(); }

void StoreWriter::start() {
  thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

void StoreWriter::stop() {
  if (!thread_.joinable()) {
    return;
  }
  queue_.close();
  thread_.request_stop();
  thread_.join();
}

void StoreWriter::request_retention(const TierTtls& ttls) {
  std::lock_guard<std::mutex> lock(mutex_);
  requested_retention_ = std::make_pair(ttls, clock_());
}

WriterStats StoreWriter::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void StoreWriter::run(std::stop_token st) {
  if (!open_store()) {
    enter_degraded("history store could not be opened at " + store_options_.path);
  }
  last_maintenance_ms_ = clock_();

  std::vector<model::IngestItem> batch;
  batch.reserve(options_.batch_size);
  while (!queue_.finished()) {
    batch.clear();
    queue_.pop_batch(batch, options_.batch_size, options_.flush_interval);
    if (!batch.empty()) {
      write(batch, st);
    }

    const std::int64_t now_ms = clock_();
    bool retention_requested = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      retention_requested = requested_retention_.has_value();
    }
    if (store_ != nullptr && !stats().degraded &&
        (retention_requested || now_ms - last_maintenance_ms_ >= options_.maintenance_interval.count())) {
      maintain(now_ms);
    }
  }

  if (store_ != nullptr && !stats().degraded) {
    bool retention_requested = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      retention_requested = requested_retention_.has_value();
    }
    if (retention_requested) {
      maintain(clock_());
    } else {
      try {
        store_->rollup(clock_());
      } catch (const StoreError& ex) {
        std::cerr << "[writer] final rollup failed: " << ex.what() << '\n';
      }
    }
  }
  std::cerr << "[writer] drained ingestion queue; exiting\n";
}

bool StoreWriter::open_store() {
  try {
    store_ = std::make_unique<TieredStore>(store_options_);
    const OpenReport& report = store_->open_report();
    std::cerr << "[writer] store " << to_string(report.outcome) << " at " << store_options_.path << '\n';
    if (report.outcome == OpenOutcome::RECREATED) {
      post_notice(NoticeKind::STORE_RECREATED,
                  "history store could not be used (" + report.reason + "); previous file kept as " +
                      report.backup_path);
    }

    policy_ = store_->load_retention(configured_ttls_, grace_period_);
    // Only a changed config file re-requests its TTLs; otherwise a pending
    // shortening from set_retention would be cancelled on every restart.
    const auto applied = store_->load_configured_ttls();
    if (!applied.has_value() || *applied != configured_ttls_) {
      storage::request_retention(policy_, configured_ttls_, clock_());
      store_->save_retention(policy_);
      store_->save_configured_ttls(configured_ttls_);
    }
    return true;
  } catch (const StoreError& ex) {
    std::cerr << "[writer] unable to open store: " << ex.what() << '\n';
    store_.reset();
    return false;
  }
}

void StoreWriter::write(std::vector<model::IngestItem>& batch, std::stop_token st) {
  if (stats().degraded) {
    const std::int64_t now_ms = clock_();
    if (now_ms - last_probe_ms_ >= options_.recovery_interval.count()) {
      last_probe_ms_ = now_ms;
      if ((store_ != nullptr || open_store()) && try_write(batch)) {
        leave_degraded();
        return;
      }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.items_lost += batch.size();
    return;
  }

  auto backoff = options_.initial_backoff;
  while (true) {
    if (try_write(batch)) {
      consecutive_failures_ = 0;
      return;
    }

    ++consecutive_failures_;
    if (consecutive_failures_ >= options_.degrade_after_failures) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.items_lost += batch.size();
      }
      enter_degraded("history writes failed " + std::to_string(consecutive_failures_) + " times in a row");
      return;
    }

    if (st.stop_requested() || !wait_for(backoff, st)) {
      std::lock_guard<std::mutex> lock(mutex_);
      stats_.items_lost += batch.size();
      return;
    }
    backoff = std::min(backoff * 2, options_.max_backoff);
  }
}

bool StoreWriter::try_write(const std::vector<model::IngestItem>& batch) {
  if (store_ == nullptr) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.write_failures;
    return false;
  }

  try {
    store_->insert_batch(batch);
  } catch (const StoreError& ex) {
    std::cerr << "[writer] batch write failed (attempt " << (consecutive_failures_ + 1) << "): " << ex.what() << '\n';
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.write_failures;
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  stats_.items_written += batch.size();
  ++stats_.batches_written;
  return true;
}

void StoreWriter::maintain(const std::int64_t now_ms) {
  last_maintenance_ms_ = now_ms;
  try {
    std::optional<std::pair<TierTtls, std::int64_t>> requested;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requested.swap(requested_retention_);
    }

    bool policy_changed = false;
    if (requested.has_value()) {
      storage::request_retention(policy_, requested->first, requested->second);
      policy_changed = true;
    }
    policy_changed = settle_retention(policy_, now_ms) || policy_changed;
    if (policy_changed) {
      store_->save_retention(policy_);
    }

    const RollupReport rollup = store_->rollup(now_ms);
    const PruneReport pruned = store_->prune(policy_.current, now_ms);

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.rollups;
    ++stats_.prunes;
    if (pruned.total() > 0) {
      std::cerr << "[writer] pruned raw=" << pruned.raw_rows << " minute=" << pruned.minute_rows
                << " hour=" << pruned.hour_rows << " gaps=" << pruned.discontinuities
                << " (minute watermark " << rollup.minute_watermark_ms << ")\n";
    }
  } catch (const StoreError& ex) {
    std::cerr << "[writer] maintenance failed: " << ex.what() << '\n';
  }
}

void StoreWriter::enter_degraded(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stats_.degraded) {
      return;
    }
    stats_.degraded = true;
  }
  last_probe_ms_ = clock_();
  std::cerr << "[writer] entering live-tail-only mode: " << reason << '\n';
  post_notice(NoticeKind::STORE_DEGRADED, reason + "; long-range history is unavailable, live rates continue");
}

void StoreWriter::leave_degraded() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.degraded = false;
  }
  consecutive_failures_ = 0;
  std::cerr << "[writer] history store recovered\n";
  post_notice(NoticeKind::STORE_RECOVERED, "history store recovered; recording resumed");
}

void StoreWriter::post_notice(const NoticeKind kind, const std::string& message) {
  notices_.push(Notice{.kind = kind, .message = message, .at_ms = clock_()});
}

bool StoreWriter::wait_for(const std::chrono::milliseconds delay, std::stop_token st) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  wait_cv_.wait_for(lock, st, delay, [] { return false; });
  return !st.stop_requested();
}

}  // namespace netspeed::storage
