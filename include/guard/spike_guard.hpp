#pragma once

#include <chrono>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "model/sample.hpp"

namespace netspeed::guard {

struct SpikeGuardOptions {
  // 100 Gbps; anything above is a driver flush, not traffic.
  double rate_ceiling_bps{12'500'000'000.0};
  // Stricter bound a sample must meet to end a suspect window early.
  double reprime_rate_ceiling_bps{1'250'000'000.0};
  std::chrono::milliseconds sleep_threshold{50'000};
  std::uint32_t reprime_ticks{3};
};

// A suspect sample is discarded and moves NORMAL straight to REPRIMING, so
// the suspect condition never outlives the tick that triggered it.
enum class GuardState : std::uint8_t {
  NORMAL = 0,
  REPRIMING = 1,
};

struct GuardStatus {
  GuardState state{GuardState::NORMAL};
  std::uint32_t remaining{0};
};

enum class GuardDecision : std::uint8_t {
  ACCEPT = 0,
  DISCARD = 1,
};

// Per-interface state machine between the sampler and persistence. Baselines
// are not touched here: the sampler always re-baselines on the newest reading,
// so a discarded interval simply becomes a recorded gap.
class SpikeGuard {
 public:
  explicit SpikeGuard(SpikeGuardOptions options = {});

  // Appends a GUARD_DISCARD marker to discontinuities on every discard.
  GuardDecision evaluate(const model::Sample& sample, std::vector<model::Discontinuity>& discontinuities);

  void forget(const model::InterfaceId& id);

  [[nodiscard]] GuardStatus status(const model::InterfaceId& id) const;
  [[nodiscard]] std::uint64_t discarded() const noexcept;
  [[nodiscard]] std::uint64_t accepted() const noexcept;

 private:
  [[nodiscard]] bool within(const model::Sample& sample, double rate_ceiling_bps) const noexcept;

  SpikeGuardOptions options_;
  std::unordered_map<model::InterfaceId, GuardStatus> states_{};
  std::uint64_t discarded_{0};
  std::uint64_t accepted_{0};
};

}  // namespace netspeed::guard
