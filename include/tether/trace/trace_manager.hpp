#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "tether/trace/trace_event.hpp"
#include "tether/trace/trace_sink.hpp"

namespace tether::trace {

// Records engine events when enabled (disabled by default; Emit* calls are
// cheap no-ops then). Events are kept for post-run queries and forwarded to
// every registered sink in emission order.
class TraceManager {
 public:
  void SetEnabled(bool enabled) {
    enabled_ = enabled;
  }
  [[nodiscard]] bool IsEnabled() const {
    return enabled_;
  }

  void AddSink(std::unique_ptr<TraceSink> sink);

  void EmitPassBegin(uint64_t pass);
  void EmitComponentRender(uint32_t component, uint32_t round);
  void EmitAtomWrite(uint32_t atom_index, bool changed);
  void EmitIdentityEvicted(std::string identity);
  void EmitStaleWrite(uint32_t atom_index);

  // Post-run query.
  [[nodiscard]] auto Events() const -> const std::vector<TraceEvent>&;
  [[nodiscard]] auto CountRenders(uint32_t component) const -> size_t;
  [[nodiscard]] auto CountPasses() const -> size_t;
  [[nodiscard]] auto CountEvictions() const -> size_t;
  [[nodiscard]] auto CountAtomWrites(uint32_t atom_index, bool changed) const
      -> size_t;

  void Clear() {
    events_.clear();
  }

  // Print summary.
  // Format: __TETHER_TRACE__: passes=N renders=R writes=W evictions=E stale=S
  // Plus per-unit lines: __TETHER_TRACE_UNIT__: unit=U renders=R
  void PrintSummary(std::FILE* out = stdout) const;

 private:
  void Record(TraceEvent event);

  bool enabled_ = false;
  std::vector<TraceEvent> events_;
  std::vector<std::unique_ptr<TraceSink>> sinks_;
};

}  // namespace tether::trace
