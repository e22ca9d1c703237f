#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace netspeed::model {

// Name-based adapter handle. A name reused by different hardware within one
// session is suffixed ("eth0#2").
using InterfaceId = std::string;

struct Sample {
  InterfaceId interface_id{};
  std::int64_t interval_start_ms{0};
  std::int64_t interval_end_ms{0};
  std::uint64_t bytes_down{0};
  std::uint64_t bytes_up{0};

  [[nodiscard]] std::int64_t duration_ms() const noexcept { return interval_end_ms - interval_start_ms; }

  [[nodiscard]] double rate_down_bps() const noexcept {
    return duration_ms() > 0 ? static_cast<double>(bytes_down) * 1000.0 / static_cast<double>(duration_ms()) : 0.0;
  }

  [[nodiscard]] double rate_up_bps() const noexcept {
    return duration_ms() > 0 ? static_cast<double>(bytes_up) * 1000.0 / static_cast<double>(duration_ms()) : 0.0;
  }
};

enum class DiscontinuityReason : std::uint8_t {
  COUNTER_RESET = 0,
  CLOCK_JUMP = 1,
  GUARD_DISCARD = 2,
};

inline const char* to_string(const DiscontinuityReason reason) noexcept {
  switch (reason) {
    case DiscontinuityReason::COUNTER_RESET:
      return "counter_reset";
    case DiscontinuityReason::CLOCK_JUMP:
      return "clock_jump";
    case DiscontinuityReason::GUARD_DISCARD:
      return "guard_discard";
  }
  return "unknown";
}

// Recorded gap in the raw tier. Counter resets are zero-duration
// (start == end); guard discards cover the discarded interval.
struct Discontinuity {
  InterfaceId interface_id{};
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};
  DiscontinuityReason reason{DiscontinuityReason::COUNTER_RESET};
};

struct InterfaceUpdate {
  InterfaceId interface_id{};
  std::string name{};
  std::string description{};
  std::int64_t seen_at_ms{0};
  bool active{true};
};

using IngestItem = std::variant<Sample, Discontinuity, InterfaceUpdate>;

struct LiveRate {
  InterfaceId interface_id{};
  double rate_down_bps{0.0};
  double rate_up_bps{0.0};
  std::int64_t timestamp_ms{0};
};

enum class Tier : std::uint8_t {
  RAW = 0,
  MINUTE = 1,
  HOUR = 2,
};

inline const char* to_string(const Tier tier) noexcept {
  switch (tier) {
    case Tier::RAW:
      return "raw";
    case Tier::MINUTE:
      return "minute";
    case Tier::HOUR:
      return "hour";
  }
  return "unknown";
}

constexpr std::int64_t kMinuteBucketMs = 60'000;
constexpr std::int64_t kHourBucketMs = 3'600'000;

constexpr std::int64_t bucket_width_ms(const Tier tier) noexcept {
  return tier == Tier::HOUR ? kHourBucketMs : (tier == Tier::MINUTE ? kMinuteBucketMs : 0);
}

// Buckets are (start, end]: a row whose interval ends exactly on a boundary
// belongs to the bucket that boundary closes.
constexpr std::int64_t bucket_start_for(const std::int64_t interval_end_ms, const std::int64_t width_ms) noexcept {
  return ((interval_end_ms - 1) / width_ms) * width_ms;
}

struct TierRow {
  InterfaceId interface_id{};
  std::int64_t bucket_start_ms{0};
  std::uint64_t bytes_down_total{0};
  std::uint64_t bytes_up_total{0};
  double bytes_down_max_rate{0.0};
  double bytes_up_max_rate{0.0};
  std::uint64_t sample_count{0};
  std::int64_t last_interval_end_ms{0};
};

}  // namespace netspeed::model
