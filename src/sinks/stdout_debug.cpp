#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace netspeed::sinks {

void StdoutDebugSink::publish(const std::vector<model::LiveRate>& rates) const {
  for (const auto& rate : rates) {
    std::printf("[rate] %s down_mbps=%.3f up_mbps=%.3f t=%lld\n", rate.interface_id.c_str(),
                rate.rate_down_bps * 8.0 / 1'000'000.0, rate.rate_up_bps * 8.0 / 1'000'000.0,
                static_cast<long long>(rate.timestamp_ms));
  }
}

}  // namespace netspeed::sinks
