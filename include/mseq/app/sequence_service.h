#pragma once

#include "mseq/core/clock.h"
#include "mseq/core/id_generator.h"
#include "mseq/core/services.h"
#include "mseq/sequence/config_manager.h"
#include "mseq/sequence/format_swap_migration.h"
#include "mseq/sequence/reformat_migrator.h"
#include "mseq/sequence/sequence_allocator.h"
#include "mseq/storage/audit_event.h"

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace mseq::app {

// Every use case runs under a trace id (generated unless the caller supplies one)
// and appends its audit events to services.audit_log under that id.
// audit_dropped counts events the log refused; the result stands regardless.
template <typename T>
struct TracedResult {
  std::string trace_id;              // NOLINT(readability-identifier-naming)
  domain::SequenceResult<T> result;  // NOLINT(readability-identifier-naming)
  int audit_dropped{0};              // NOLINT(readability-identifier-naming)
};

// ────────────────────────────────────────────────────────────────
// Config lifecycle
// ────────────────────────────────────────────────────────────────

struct CreateConfigCommand {
  sequence::CreateConfigRequest request;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;    // NOLINT(readability-identifier-naming)
};

// Emits SequenceConfigCreated on success.
[[nodiscard]] TracedResult<domain::SequenceConfig> run_create_config(
    const CreateConfigCommand& cmd, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

struct UpdateConfigCommand {
  core::ConfigId config_id;            // NOLINT(readability-identifier-naming)
  sequence::ConfigUpdate update;       // NOLINT(readability-identifier-naming)
  // Re-render existing machine identifiers when the template changes.
  bool reformat_existing{false};        // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct UpdateConfigOutcome {
  sequence::ConfigChange change;                            // NOLINT(readability-identifier-naming)
  std::optional<sequence::ReformatReport> reformat;         // NOLINT(readability-identifier-naming)
  std::optional<domain::SequenceFailure> reformat_error;    // NOLINT(readability-identifier-naming)
};

// Emits SequenceConfigUpdated; with reformat_existing and a changed template
// also the Reformat* events. The update stays committed when the reformat fails;
// the failure is reported in reformat_error.
[[nodiscard]] TracedResult<UpdateConfigOutcome> run_update_config(const UpdateConfigCommand& cmd,
                                                                  core::Services& services,
                                                                  core::IIdGenerator& id_gen,
                                                                  core::IClock& clock);

struct ResetSequenceCommand {
  core::ConfigId config_id;             // NOLINT(readability-identifier-naming)
  std::int64_t new_starting_number{1};  // NOLINT(readability-identifier-naming)
  std::string updated_by;               // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

// Emits SequenceReset on success.
[[nodiscard]] TracedResult<domain::SequenceConfig> run_reset_sequence(
    const ResetSequenceCommand& cmd, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

struct DeleteConfigCommand {
  core::ConfigId config_id;             // NOLINT(readability-identifier-naming)
  std::string deleted_by;               // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

// Emits SequenceConfigDeleted on success.
[[nodiscard]] TracedResult<domain::SequenceConfig> run_delete_config(
    const DeleteConfigCommand& cmd, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Identifier allocation
// ────────────────────────────────────────────────────────────────

struct GenerateIdentifierCommand {
  domain::SequenceScope scope;          // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

// Emits SequenceIssued or SequenceGenerationFailed.
[[nodiscard]] TracedResult<sequence::AllocationOutcome> run_generate_identifier(
    const GenerateIdentifierCommand& cmd, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock, std::stop_token stop = {});

struct AssignIdentifierCommand {
  core::MachineId machine_id;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

// Allocates from the machine's own scope and stores the identifier on the machine.
// A number whose identifier cannot be stored stays consumed; the machine keeps its
// previous identifier and can simply be assigned again.
[[nodiscard]] TracedResult<sequence::AllocationOutcome> run_assign_identifier(
    const AssignIdentifierCommand& cmd, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock, std::stop_token stop = {});

// ────────────────────────────────────────────────────────────────
// Migrations
// ────────────────────────────────────────────────────────────────

struct ReformatCommand {
  sequence::ReformatRequest request;    // NOLINT(readability-identifier-naming)
  std::string actor;                    // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

// Emits ReformatStarted, one ReformatItemFailed per failed item, ReformatCompleted.
[[nodiscard]] TracedResult<sequence::ReformatReport> run_reformat(const ReformatCommand& cmd,
                                                                  core::Services& services,
                                                                  core::IIdGenerator& id_gen,
                                                                  core::IClock& clock);

struct FormatSwapCommand {
  bool preview{false};                  // NOLINT(readability-identifier-naming)
  std::string actor;                    // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct FormatSwapResponse {
  std::string trace_id;               // NOLINT(readability-identifier-naming)
  sequence::FormatSwapReport report;  // NOLINT(readability-identifier-naming)
  int audit_dropped{0};               // NOLINT(readability-identifier-naming)
};

// Emits FormatSwapApplied (also in preview mode, flagged as such).
[[nodiscard]] FormatSwapResponse run_format_swap(const FormatSwapCommand& cmd,
                                                 core::Services& services,
                                                 core::IIdGenerator& id_gen, core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

// Fetch all audit events for a given trace_id
[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace mseq::app
