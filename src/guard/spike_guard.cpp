#include "guard/spike_guard.hpp"

#include <algorithm>

namespace netspeed::guard {

SpikeGuard::SpikeGuard(SpikeGuardOptions options) : options_(options) {}

GuardDecision SpikeGuard::evaluate(const model::Sample& sample, std::vector<model::Discontinuity>& discontinuities) {
  GuardStatus& status = states_[sample.interface_id];
  bool accept = false;

  switch (status.state) {
    case GuardState::NORMAL:
      if (within(sample, options_.rate_ceiling_bps)) {
        accept = true;
      } else if (options_.reprime_ticks == 0) {
        // Suspect: the trigger itself is dropped, with no window after it.
        status = GuardStatus{GuardState::NORMAL, 0};
      } else {
        // Suspect: the trigger is dropped and the window starts at once.
        status = GuardStatus{GuardState::REPRIMING, options_.reprime_ticks};
      }
      break;

    case GuardState::REPRIMING:
      if (within(sample, options_.reprime_rate_ceiling_bps)) {
        status = GuardStatus{GuardState::NORMAL, 0};
        accept = true;
      } else if (status.remaining <= 1) {
        status = GuardStatus{GuardState::NORMAL, 0};
      } else {
        --status.remaining;
      }
      break;
  }

  if (accept) {
    ++accepted_;
    return GuardDecision::ACCEPT;
  }

  ++discarded_;
  discontinuities.push_back(model::Discontinuity{.interface_id = sample.interface_id,
                                                 .start_ms = sample.interval_start_ms,
                                                 .end_ms = sample.interval_end_ms,
                                                 .reason = model::DiscontinuityReason::GUARD_DISCARD});
  return GuardDecision::DISCARD;
}

void SpikeGuard::forget(const model::InterfaceId& id) { states_.erase(id); }

GuardStatus SpikeGuard::status(const model::InterfaceId& id) const {
  const auto it = states_.find(id);
  if (it == states_.end()) {
    return {};
  }
  return it->second;
}

std::uint64_t SpikeGuard::discarded() const noexcept { return discarded_; }

std::uint64_t SpikeGuard::accepted() const noexcept { return accepted_; }

bool SpikeGuard::within(const model::Sample& sample, const double rate_ceiling_bps) const noexcept {
  if (sample.duration_ms() > options_.sleep_threshold.count()) {
    return false;
  }
  return std::max(sample.rate_down_bps(), sample.rate_up_bps()) <= rate_ceiling_bps;
}

}  // namespace netspeed::guard
