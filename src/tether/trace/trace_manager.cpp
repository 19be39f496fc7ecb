#include "tether/trace/trace_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "tether/common/overloaded.hpp"
#include "tether/trace/trace_event.hpp"
#include "tether/trace/trace_sink.hpp"

namespace tether::trace {

void TraceManager::AddSink(std::unique_ptr<TraceSink> sink) {
  sinks_.push_back(std::move(sink));
}

void TraceManager::EmitPassBegin(uint64_t pass) {
  Record(PassBegin{.pass = pass});
}

void TraceManager::EmitComponentRender(uint32_t component, uint32_t round) {
  Record(ComponentRender{.component = component, .round = round});
}

void TraceManager::EmitAtomWrite(uint32_t atom_index, bool changed) {
  Record(AtomWrite{.atom_index = atom_index, .changed = changed});
}

void TraceManager::EmitIdentityEvicted(std::string identity) {
  Record(IdentityEvicted{.identity = std::move(identity)});
}

void TraceManager::EmitStaleWrite(uint32_t atom_index) {
  Record(StaleWrite{.atom_index = atom_index});
}

auto TraceManager::Events() const -> const std::vector<TraceEvent>& {
  return events_;
}

auto TraceManager::CountRenders(uint32_t component) const -> size_t {
  size_t count = 0;
  for (const auto& event : events_) {
    if (const auto* render = std::get_if<ComponentRender>(&event)) {
      if (render->component == component) {
        ++count;
      }
    }
  }
  return count;
}

auto TraceManager::CountPasses() const -> size_t {
  size_t count = 0;
  for (const auto& event : events_) {
    if (std::holds_alternative<PassBegin>(event)) {
      ++count;
    }
  }
  return count;
}

auto TraceManager::CountEvictions() const -> size_t {
  size_t count = 0;
  for (const auto& event : events_) {
    if (std::holds_alternative<IdentityEvicted>(event)) {
      ++count;
    }
  }
  return count;
}

auto TraceManager::CountAtomWrites(uint32_t atom_index, bool changed) const
    -> size_t {
  size_t count = 0;
  for (const auto& event : events_) {
    if (const auto* write = std::get_if<AtomWrite>(&event)) {
      if (write->atom_index == atom_index && write->changed == changed) {
        ++count;
      }
    }
  }
  return count;
}

void TraceManager::PrintSummary(std::FILE* out) const {
  size_t passes = 0;
  size_t renders = 0;
  size_t writes = 0;
  size_t evictions = 0;
  size_t stale = 0;
  std::map<uint32_t, size_t> unit_renders;

  for (const auto& event : events_) {
    std::visit(
        Overloaded{
            [&](const PassBegin&) { ++passes; },
            [&](const ComponentRender& e) {
              ++renders;
              ++unit_renders[e.component];
            },
            [&](const AtomWrite&) { ++writes; },
            [&](const IdentityEvicted&) { ++evictions; },
            [&](const StaleWrite&) { ++stale; },
        },
        event);
  }

  fmt::print(
      out,
      "__TETHER_TRACE__: passes={} renders={} writes={} evictions={} "
      "stale={}\n",
      passes, renders, writes, evictions, stale);
  for (const auto& [unit, count] : unit_renders) {
    fmt::print(out, "__TETHER_TRACE_UNIT__: unit={} renders={}\n", unit, count);
  }
}

void TraceManager::Record(TraceEvent event) {
  if (!enabled_) {
    return;
  }
  for (const auto& sink : sinks_) {
    sink->OnEvent(event);
  }
  events_.push_back(std::move(event));
}

}  // namespace tether::trace
