#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "core/interface_registry.hpp"
#include "model/sample.hpp"
#include "sensors/counter_source.hpp"

namespace netspeed::core {

struct SamplerOptions {
  std::chrono::milliseconds min_interval{1000};
  std::chrono::milliseconds max_interval{10000};
  // Consecutive all-idle ticks before the interval starts doubling.
  std::uint32_t idle_ticks_before_backoff{5};
  std::chrono::milliseconds inactive_after{0};
};

enum class InterfacePhase : std::uint8_t {
  BASELINING = 0,
  TRACKING = 1,
};

struct SamplerOutput {
  std::vector<model::Sample> samples{};
  std::vector<model::Discontinuity> discontinuities{};
  std::vector<model::InterfaceUpdate> interface_updates{};
};

// Turns cumulative counter snapshots into per-interval deltas. Every interval
// is bounded by two stamped readings, so cadence changes never affect totals.
class Sampler {
 public:
  explicit Sampler(SamplerOptions options = {});

  SamplerOutput tick(const sensors::CounterSnapshot& snapshot, std::int64_t now_ms);

  // Records a failed poll: baselines and cadence are left untouched.
  void skip_tick() noexcept;

  [[nodiscard]] std::chrono::milliseconds interval() const noexcept;
  [[nodiscard]] std::uint64_t ticks() const noexcept;
  [[nodiscard]] std::uint64_t skipped_ticks() const noexcept;
  [[nodiscard]] std::optional<InterfacePhase> phase(const model::InterfaceId& id) const;
  [[nodiscard]] const InterfaceRegistry& registry() const noexcept;

 private:
  struct Baseline {
    std::uint64_t bytes_down{0};
    std::uint64_t bytes_up{0};
    std::int64_t timestamp_ms{0};
    InterfacePhase phase{InterfacePhase::BASELINING};
  };

  void update_cadence(bool saw_samples, bool saw_activity) noexcept;

  SamplerOptions options_;
  InterfaceRegistry registry_;
  std::unordered_map<model::InterfaceId, Baseline> last_counters_{};
  std::chrono::milliseconds interval_{};
  std::uint32_t idle_ticks_{0};
  std::uint64_t tick_count_{0};
  std::uint64_t skipped_ticks_{0};
};

}  // namespace netspeed::core
