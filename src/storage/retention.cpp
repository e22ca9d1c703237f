#include "storage/retention.hpp"

namespace netspeed::storage {

namespace {

void request_tier(std::chrono::milliseconds& current, std::optional<PendingTtl>& pending,
                  const std::chrono::milliseconds requested, const std::int64_t now_ms) {
  if (requested >= current) {
    current = requested;
    pending.reset();
    return;
  }

  if (pending.has_value() && pending->ttl == requested) {
    return;
  }
  pending = PendingTtl{requested, now_ms};
}

bool settle_tier(std::chrono::milliseconds& current, std::optional<PendingTtl>& pending,
                 const std::chrono::milliseconds grace_period, const std::int64_t now_ms) {
  if (!pending.has_value() || now_ms - pending->requested_at_ms < grace_period.count()) {
    return false;
  }
  current = pending->ttl;
  pending.reset();
  return true;
}

}  // namespace

void request_retention(RetentionPolicy& policy, const TierTtls& requested, const std::int64_t now_ms) {
  request_tier(policy.current.raw, policy.pending_raw, requested.raw, now_ms);
  request_tier(policy.current.minute, policy.pending_minute, requested.minute, now_ms);
  request_tier(policy.current.hour, policy.pending_hour, requested.hour, now_ms);
}

bool settle_retention(RetentionPolicy& policy, const std::int64_t now_ms) {
  bool changed = settle_tier(policy.current.raw, policy.pending_raw, policy.grace_period, now_ms);
  changed = settle_tier(policy.current.minute, policy.pending_minute, policy.grace_period, now_ms) || changed;
  changed = settle_tier(policy.current.hour, policy.pending_hour, policy.grace_period, now_ms) || changed;
  return changed;
}

}  // namespace netspeed::storage
