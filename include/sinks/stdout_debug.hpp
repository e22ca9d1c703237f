#pragma once

#include <vector>

#include "model/sample.hpp"

namespace netspeed::sinks {

class StdoutDebugSink {
 public:
  void publish(const std::vector<model::LiveRate>& rates) const;
};

}  // namespace netspeed::sinks
