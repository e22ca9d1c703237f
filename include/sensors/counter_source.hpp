#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace netspeed::sensors {

struct InterfaceCounters {
  std::uint64_t bytes_down{0};
  std::uint64_t bytes_up{0};
  // Best-effort hardware identity used to tell apart adapters that reuse a name.
  std::string description{};
};

// Keyed by OS interface name.
using CounterSnapshot = std::map<std::string, InterfaceCounters>;

class CounterSource {
 public:
  virtual ~CounterSource() = default;

  // Fills snapshot with every interface currently present. Returns false when
  // enumeration itself failed; the snapshot is then left empty and the caller
  // must keep its baselines.
  virtual bool poll(CounterSnapshot& snapshot) noexcept = 0;
};

class SysfsCounterSource final : public CounterSource {
 public:
  explicit SysfsCounterSource(std::string root = "/sys/class/net", bool include_loopback = false);

  bool poll(CounterSnapshot& snapshot) noexcept override;

 private:
  static bool read_u64_file(const std::string& path, std::uint64_t& value) noexcept;
  static std::string read_first_line(const std::string& path) noexcept;

  std::string root_;
  bool include_loopback_{false};
};

}  // namespace netspeed::sensors
