#include "mseq/app/sequence_service.h"

#include "mseq/app/json_views.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace mseq::app {

using domain::SequenceConfig;
using domain::SequenceError;
using domain::SequenceResult;

namespace {

using storage::AuditEventType;

// Appends the events of one trace. A refused append does not undo the state
// change it describes; it is counted and handed back as audit_dropped.
class TraceRecorder {
 public:
  TraceRecorder(const std::optional<std::string>& requested, core::Services& services,
                core::IIdGenerator& id_gen, core::IClock& clock)
      : trace_id_(requested.value_or("")),
        log_(services.audit_log),
        id_gen_(id_gen),
        clock_(clock) {
    if (trace_id_.empty()) {
      trace_id_ = core::new_trace_id(id_gen).value;
    }
  }

  [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
  [[nodiscard]] int dropped() const { return dropped_; }

  void record(AuditEventType type, const nlohmann::json& payload, std::vector<std::string> refs) {
    storage::AuditEvent event{core::new_event_id(id_gen_), trace_id_,
                              storage::audit_event_type_name(type), payload.dump(),
                              clock_.now_iso8601(), std::move(refs)};
    if (!log_.append(event).has_value()) {
      ++dropped_;
    }
  }

  // Folds in the drops of a nested use case run under the same trace.
  void absorb(int dropped) { dropped_ += dropped; }

  template <typename T>
  [[nodiscard]] TracedResult<T> finish(SequenceResult<T> result) const {
    return {trace_id_, std::move(result), dropped_};
  }

 private:
  std::string trace_id_;
  storage::IAuditLog& log_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  int dropped_{0};
};

std::vector<std::string> scope_refs(const domain::SequenceScope& scope) {
  std::vector<std::string> refs{scope.category_id.value};
  if (scope.subcategory_id.has_value()) {
    refs.push_back(scope.subcategory_id->value);
  }
  return refs;
}

std::vector<std::string> config_refs(const SequenceConfig& config) {
  auto refs = scope_refs(config.scope);
  refs.insert(refs.begin(), config.config_id.value);
  return refs;
}

// Shared by the standalone reformat and the opt-in reformat after a template update.
SequenceResult<sequence::ReformatReport> reformat_with_audit(
    const sequence::ReformatRequest& request, const std::string& actor, TraceRecorder& audit,
    core::Services& services) {
  nlohmann::json started;
  started["scope"] = to_json(request.scope);
  started["old_format"] = request.old_format;
  started["new_format"] = request.new_format;
  started["dry_run"] = request.dry_run;
  started["actor"] = actor;
  audit.record(AuditEventType::kReformatStarted, started, scope_refs(request.scope));

  sequence::ReformatMigrator migrator(services.categories, services.machines);
  auto result = migrator.run(request);
  if (!result.has_value()) {
    nlohmann::json failed;
    failed["error"] = to_json(result.error());
    audit.record(AuditEventType::kReformatCompleted, failed, scope_refs(request.scope));
    return result;
  }

  const auto& report = result.value();
  for (const auto& item : report.items) {
    if (item.outcome == sequence::ReformatOutcome::kFailed) {
      audit.record(AuditEventType::kReformatItemFailed, to_json(item), {item.machine_id.value});
    }
  }

  nlohmann::json completed;
  completed["updated"] = report.updated;
  completed["unchanged"] = report.unchanged;
  completed["undecodable"] = report.undecodable;
  completed["failed"] = report.failed;
  completed["dry_run"] = report.dry_run;
  audit.record(AuditEventType::kReformatCompleted, completed, scope_refs(request.scope));

  return result;
}

}  // namespace

TracedResult<SequenceConfig> run_create_config(const CreateConfigCommand& cmd,
                                               core::Services& services,
                                               core::IIdGenerator& id_gen, core::IClock& clock) {
  TraceRecorder audit(cmd.trace_id, services, id_gen, clock);

  sequence::SequenceConfigManager manager(services.configs, services.categories, id_gen, clock);
  auto result = manager.create(cmd.request);
  if (result.has_value()) {
    nlohmann::json payload;
    payload["config"] = to_json(result.value());
    audit.record(AuditEventType::kSequenceConfigCreated, payload, config_refs(result.value()));
  }
  return audit.finish(std::move(result));
}

TracedResult<UpdateConfigOutcome> run_update_config(const UpdateConfigCommand& cmd,
                                                    core::Services& services,
                                                    core::IIdGenerator& id_gen,
                                                    core::IClock& clock) {
  using R = SequenceResult<UpdateConfigOutcome>;
  TraceRecorder audit(cmd.trace_id, services, id_gen, clock);

  sequence::SequenceConfigManager manager(services.configs, services.categories, id_gen, clock);
  auto changed = manager.update(cmd.config_id, cmd.update);
  if (!changed.has_value()) {
    return audit.finish(R::err(changed.error()));
  }

  UpdateConfigOutcome outcome{changed.value(), std::nullopt, std::nullopt};
  const auto& change = outcome.change;

  nlohmann::json payload;
  payload["before"] = to_json(change.before);
  payload["after"] = to_json(change.after);
  payload["template_changed"] = change.template_changed();
  payload["counter_reset"] = change.counter_reset();
  payload["reformat_requested"] = cmd.reformat_existing;
  audit.record(AuditEventType::kSequenceConfigUpdated, payload, config_refs(change.after));

  if (cmd.reformat_existing && change.template_changed()) {
    sequence::ReformatRequest request{change.after.scope, change.before.format,
                                      change.after.format, false};
    auto reformat = reformat_with_audit(request, cmd.update.updated_by, audit, services);
    if (reformat.has_value()) {
      outcome.reformat = reformat.value();
    } else {
      outcome.reformat_error = reformat.error();
    }
  }

  return audit.finish(R::ok(std::move(outcome)));
}

TracedResult<SequenceConfig> run_reset_sequence(const ResetSequenceCommand& cmd,
                                                core::Services& services,
                                                core::IIdGenerator& id_gen, core::IClock& clock) {
  TraceRecorder audit(cmd.trace_id, services, id_gen, clock);

  sequence::SequenceConfigManager manager(services.configs, services.categories, id_gen, clock);
  auto result = manager.reset(cmd.config_id, cmd.new_starting_number, cmd.updated_by);
  if (result.has_value()) {
    nlohmann::json payload;
    payload["config_id"] = result.value().config_id.value;
    payload["starting_number"] = result.value().starting_number;
    payload["current_sequence"] = result.value().current_sequence;
    payload["updated_by"] = cmd.updated_by;
    audit.record(AuditEventType::kSequenceReset, payload, config_refs(result.value()));
  }
  return audit.finish(std::move(result));
}

TracedResult<SequenceConfig> run_delete_config(const DeleteConfigCommand& cmd,
                                               core::Services& services,
                                               core::IIdGenerator& id_gen, core::IClock& clock) {
  TraceRecorder audit(cmd.trace_id, services, id_gen, clock);

  sequence::SequenceConfigManager manager(services.configs, services.categories, id_gen, clock);
  auto result = manager.remove(cmd.config_id);
  if (result.has_value()) {
    nlohmann::json payload;
    payload["config"] = to_json(result.value());
    payload["deleted_by"] = cmd.deleted_by;
    audit.record(AuditEventType::kSequenceConfigDeleted, payload, config_refs(result.value()));
  }
  return audit.finish(std::move(result));
}

TracedResult<sequence::AllocationOutcome> run_generate_identifier(
    const GenerateIdentifierCommand& cmd, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock, std::stop_token stop) {
  TraceRecorder audit(cmd.trace_id, services, id_gen, clock);

  sequence::SequenceAllocator allocator(services.configs, services.categories,
                                        services.machines);
  auto result = allocator.generate(cmd.scope, std::move(stop));

  nlohmann::json payload;
  payload["scope"] = to_json(cmd.scope);
  if (result.has_value()) {
    payload["allocation"] = to_json(result.value());
    auto refs = scope_refs(cmd.scope);
    refs.insert(refs.begin(), result.value().config_id.value);
    audit.record(AuditEventType::kSequenceIssued, payload, std::move(refs));
  } else {
    payload["error"] = to_json(result.error());
    audit.record(AuditEventType::kSequenceGenerationFailed, payload, scope_refs(cmd.scope));
  }
  return audit.finish(std::move(result));
}

TracedResult<sequence::AllocationOutcome> run_assign_identifier(
    const AssignIdentifierCommand& cmd, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock, std::stop_token stop) {
  using R = SequenceResult<sequence::AllocationOutcome>;
  TraceRecorder audit(cmd.trace_id, services, id_gen, clock);

  const auto machine = services.machines.get(cmd.machine_id);
  if (!machine.has_value() || !machine->is_live()) {
    domain::SequenceFailure failure{SequenceError::kReferenceNotFound,
                                    "Machine not found: " + cmd.machine_id.value};
    nlohmann::json payload;
    payload["machine_id"] = cmd.machine_id.value;
    payload["error"] = to_json(failure);
    audit.record(AuditEventType::kSequenceGenerationFailed, payload, {cmd.machine_id.value});
    return audit.finish(R::err(std::move(failure)));
  }

  const domain::SequenceScope scope{machine->category_id, machine->subcategory_id};
  auto generated = run_generate_identifier({scope, audit.trace_id()}, services, id_gen, clock,
                                           std::move(stop));
  audit.absorb(generated.audit_dropped);
  if (!generated.result.has_value()) {
    return audit.finish(std::move(generated.result));
  }

  const auto& outcome = generated.result.value();
  auto stored = services.machines.set_identifier(cmd.machine_id, outcome.identifier);
  if (!stored.has_value()) {
    domain::SequenceFailure failure{
        SequenceError::kStorageFailure,
        "Identifier " + outcome.identifier + " issued but not stored on machine " +
            cmd.machine_id.value};
    nlohmann::json payload;
    payload["machine_id"] = cmd.machine_id.value;
    payload["allocation"] = to_json(outcome);
    payload["error"] = to_json(failure);
    audit.record(AuditEventType::kSequenceGenerationFailed, payload,
                 {cmd.machine_id.value, outcome.config_id.value});
    return audit.finish(R::err(std::move(failure)));
  }

  return audit.finish(std::move(generated.result));
}

TracedResult<sequence::ReformatReport> run_reformat(const ReformatCommand& cmd,
                                                    core::Services& services,
                                                    core::IIdGenerator& id_gen,
                                                    core::IClock& clock) {
  TraceRecorder audit(cmd.trace_id, services, id_gen, clock);
  return audit.finish(reformat_with_audit(cmd.request, cmd.actor, audit, services));
}

FormatSwapResponse run_format_swap(const FormatSwapCommand& cmd, core::Services& services,
                                   core::IIdGenerator& id_gen, core::IClock& clock) {
  TraceRecorder audit(cmd.trace_id, services, id_gen, clock);

  sequence::FormatSwapMigration migration(services.configs, clock);
  auto report = migration.run(cmd.preview, cmd.actor);

  std::vector<std::string> refs;
  for (const auto& item : report.items) {
    if (item.new_format.has_value()) {
      refs.push_back(item.config_id.value);
    }
  }

  nlohmann::json payload = to_json(report);
  payload["actor"] = cmd.actor;
  audit.record(AuditEventType::kFormatSwapApplied, payload, std::move(refs));

  return FormatSwapResponse{audit.trace_id(), std::move(report), audit.dropped()};
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace mseq::app
