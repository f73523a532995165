#pragma once

#include "mseq/domain/category.h"
#include "mseq/domain/machine.h"
#include "mseq/domain/sequence_config.h"
#include "mseq/sequence/format_swap_migration.h"
#include "mseq/sequence/reformat_migrator.h"
#include "mseq/sequence/sequence_allocator.h"
#include "mseq/storage/audit_event.h"

#include <nlohmann/json.hpp>

namespace mseq::app {

// JSON views shared by audit payloads and CLI output.
// Optional fields are emitted as null, never omitted, so consumers see a stable shape.

[[nodiscard]] nlohmann::json to_json(const domain::SequenceScope& scope);
[[nodiscard]] nlohmann::json to_json(const domain::SequenceConfig& config);
[[nodiscard]] nlohmann::json to_json(const domain::SequenceFailure& failure);
[[nodiscard]] nlohmann::json to_json(const domain::Category& category);
[[nodiscard]] nlohmann::json to_json(const domain::Machine& machine);
[[nodiscard]] nlohmann::json to_json(const sequence::AllocationOutcome& outcome);
[[nodiscard]] nlohmann::json to_json(const sequence::ReformatItem& item);
[[nodiscard]] nlohmann::json to_json(const sequence::ReformatReport& report);
[[nodiscard]] nlohmann::json to_json(const sequence::FormatSwapReport& report);
[[nodiscard]] nlohmann::json to_json(const storage::AuditEvent& event);

}  // namespace mseq::app
