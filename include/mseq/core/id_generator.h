#pragma once

#include "mseq/core/ids.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace mseq::core {

// Prefixes of the ids the engine mints. Ids are opaque; the prefix only tells a
// reader of audit output what kind of record an id names.
inline constexpr std::string_view kConfigIdPrefix = "seqcfg";
inline constexpr std::string_view kMachineIdPrefix = "mach";
inline constexpr std::string_view kEventIdPrefix = "evt";
inline constexpr std::string_view kTraceIdPrefix = "trace";

// IIdGenerator is injected wherever an id is minted so tests can replay runs.
// Contract: next() returns "<prefix>-<suffix>" with a non-empty suffix.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;
  [[nodiscard]] virtual std::string next(std::string_view prefix) = 0;
};

// SystemIdGenerator: "<prefix>-<unix micros>-<counter>".
// Thread-safe; unique within the process and ordered by creation time.
class SystemIdGenerator final : public IIdGenerator {
 public:
  [[nodiscard]] std::string next(std::string_view prefix) override;

 private:
  std::atomic<std::uint64_t> counter_{0};
};

// DeterministicIdGenerator: "<prefix>-<n>", one counter shared by all prefixes,
// starting at `first`. The same call sequence always yields the same ids.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  explicit DeterministicIdGenerator(std::uint64_t first = 0) : counter_(first) {}

  [[nodiscard]] std::string next(std::string_view prefix) override;

 private:
  std::atomic<std::uint64_t> counter_;
};

inline ConfigId new_config_id(IIdGenerator& gen) { return ConfigId{gen.next(kConfigIdPrefix)}; }
inline MachineId new_machine_id(IIdGenerator& gen) { return MachineId{gen.next(kMachineIdPrefix)}; }
inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next(kTraceIdPrefix)}; }
inline std::string new_event_id(IIdGenerator& gen) { return gen.next(kEventIdPrefix); }

}  // namespace mseq::core
