#include "core/sampler.hpp"

#include <algorithm>
#include <unordered_set>

namespace netspeed::core {

Sampler::Sampler(SamplerOptions options)
    : options_(options), registry_(options.inactive_after), interval_(options.min_interval) {}

SamplerOutput Sampler::tick(const sensors::CounterSnapshot& snapshot, const std::int64_t now_ms) {
  SamplerOutput out{};
  ++tick_count_;

  bool saw_activity = false;
  std::unordered_set<model::InterfaceId> present;
  present.reserve(snapshot.size());

  for (const auto& [name, counters] : snapshot) {
    const auto id = registry_.observe(name, counters.description, now_ms, out.interface_updates);
    present.insert(id);

    auto [it, inserted] = last_counters_.try_emplace(id);
    Baseline& previous = it->second;
    if (inserted) {
      previous = Baseline{counters.bytes_down, counters.bytes_up, now_ms, InterfacePhase::BASELINING};
      continue;
    }

    if (counters.bytes_down < previous.bytes_down || counters.bytes_up < previous.bytes_up) {
      out.discontinuities.push_back(model::Discontinuity{.interface_id = id,
                                                         .start_ms = now_ms,
                                                         .end_ms = now_ms,
                                                         .reason = model::DiscontinuityReason::COUNTER_RESET});
      previous = Baseline{counters.bytes_down, counters.bytes_up, now_ms, InterfacePhase::BASELINING};
      continue;
    }

    if (now_ms <= previous.timestamp_ms) {
      out.discontinuities.push_back(model::Discontinuity{.interface_id = id,
                                                         .start_ms = now_ms,
                                                         .end_ms = previous.timestamp_ms,
                                                         .reason = model::DiscontinuityReason::CLOCK_JUMP});
      previous = Baseline{counters.bytes_down, counters.bytes_up, now_ms, InterfacePhase::BASELINING};
      continue;
    }

    model::Sample sample{.interface_id = id,
                         .interval_start_ms = previous.timestamp_ms,
                         .interval_end_ms = now_ms,
                         .bytes_down = counters.bytes_down - previous.bytes_down,
                         .bytes_up = counters.bytes_up - previous.bytes_up};
    saw_activity = saw_activity || sample.bytes_down != 0 || sample.bytes_up != 0;
    out.samples.push_back(std::move(sample));

    previous = Baseline{counters.bytes_down, counters.bytes_up, now_ms, InterfacePhase::TRACKING};
  }

  for (const auto& id : registry_.sweep(now_ms, out.interface_updates)) {
    last_counters_.erase(id);
  }
  // Drop baselines of interfaces that vanished but are still inside the
  // inactivity span; reappearance must start from a fresh reading.
  for (auto it = last_counters_.begin(); it != last_counters_.end();) {
    if (present.find(it->first) == present.end()) {
      it = last_counters_.erase(it);
    } else {
      ++it;
    }
  }

  update_cadence(!out.samples.empty(), saw_activity);
  return out;
}

void Sampler::skip_tick() noexcept { ++skipped_ticks_; }

std::chrono::milliseconds Sampler::interval() const noexcept { return interval_; }

std::uint64_t Sampler::ticks() const noexcept { return tick_count_; }

std::uint64_t Sampler::skipped_ticks() const noexcept { return skipped_ticks_; }

std::optional<InterfacePhase> Sampler::phase(const model::InterfaceId& id) const {
  const auto it = last_counters_.find(id);
  if (it == last_counters_.end()) {
    return std::nullopt;
  }
  return it->second.phase;
}

const InterfaceRegistry& Sampler::registry() const noexcept { return registry_; }

void Sampler::update_cadence(const bool saw_samples, const bool saw_activity) noexcept {
  if (saw_activity) {
    idle_ticks_ = 0;
    interval_ = options_.min_interval;
    return;
  }

  if (!saw_samples) {
    return;
  }

  ++idle_ticks_;
  if (idle_ticks_ >= options_.idle_ticks_before_backoff) {
    interval_ = std::min(interval_ * 2, options_.max_interval);
  }
}

}  // namespace netspeed::core
