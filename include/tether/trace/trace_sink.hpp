#pragma once

#include "tether/trace/trace_event.hpp"

namespace tether::trace {

class TraceSink {
 public:
  virtual ~TraceSink() = default;
  virtual void OnEvent(const TraceEvent& event) = 0;
};

}  // namespace tether::trace
