#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace netspeed::storage {

struct TierTtls {
  std::chrono::milliseconds raw{std::chrono::hours(24)};
  std::chrono::milliseconds minute{std::chrono::hours(24 * 30)};
  std::chrono::milliseconds hour{std::chrono::hours(24 * 365)};

  bool operator==(const TierTtls&) const = default;
};

struct PendingTtl {
  std::chrono::milliseconds ttl{0};
  std::int64_t requested_at_ms{0};

  bool operator==(const PendingTtl&) const = default;
};

// Effective TTLs plus per-tier shortenings waiting out the grace period.
struct RetentionPolicy {
  TierTtls current{};
  std::optional<PendingTtl> pending_raw{};
  std::optional<PendingTtl> pending_minute{};
  std::optional<PendingTtl> pending_hour{};
  std::chrono::milliseconds grace_period{std::chrono::hours(48)};

  [[nodiscard]] bool has_pending() const noexcept {
    return pending_raw.has_value() || pending_minute.has_value() || pending_hour.has_value();
  }
};

// Lengthening applies at once and cancels a pending shortening; requesting
// the current value is an undo; re-requesting a pending value keeps its
// original request time.
void request_retention(RetentionPolicy& policy, const TierTtls& requested, std::int64_t now_ms);

// Promotes shortenings whose grace period has elapsed. Returns true when the
// effective TTLs changed.
bool settle_retention(RetentionPolicy& policy, std::int64_t now_ms);

}  // namespace netspeed::storage
