#include "core/live_tail.hpp"

namespace netspeed::core {

LiveTail::LiveTail(const std::size_t capacity_per_interface)
    : capacity_(capacity_per_interface == 0 ? 1 : capacity_per_interface) {}

void LiveTail::push(const model::Sample& sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& ring = samples_[sample.interface_id];
  if (ring.size() >= capacity_) {
    ring.pop_front();
  }
  ring.push_back(sample);
}

std::unordered_map<model::InterfaceId, std::vector<model::Sample>> LiveTail::snapshot(const std::int64_t since_ms) const {
  std::unordered_map<model::InterfaceId, std::vector<model::Sample>> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, ring] : samples_) {
    auto& copy = out[id];
    for (const auto& sample : ring) {
      if (sample.interval_end_ms > since_ms) {
        copy.push_back(sample);
      }
    }
  }
  return out;
}

std::size_t LiveTail::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& [_, ring] : samples_) {
    total += ring.size();
  }
  return total;
}

}  // namespace netspeed::core
