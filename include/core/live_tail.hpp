#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "model/sample.hpp"

namespace netspeed::core {

// Most recent accepted samples per interface, capped and oldest-evicted.
// Written by the sampling thread, read by queries.
class LiveTail {
 public:
  explicit LiveTail(std::size_t capacity_per_interface = 600);

  void push(const model::Sample& sample);

  // Samples ending after since_ms, per interface, in emission order.
  [[nodiscard]] std::unordered_map<model::InterfaceId, std::vector<model::Sample>> snapshot(
      std::int64_t since_ms = 0) const;

  [[nodiscard]] std::size_t size() const;

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::unordered_map<model::InterfaceId, std::deque<model::Sample>> samples_{};
};

}  // namespace netspeed::core
