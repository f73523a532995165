#include "mseq/app/json_views.h"

namespace mseq::app {

namespace {

template <typename Id>
nlohmann::json optional_id(const std::optional<Id>& id) {
  return id.has_value() ? nlohmann::json(id->value) : nlohmann::json(nullptr);
}

nlohmann::json optional_string(const std::optional<std::string>& value) {
  return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json to_json(const domain::SequenceScope& scope) {
  return {
      {"category_id", scope.category_id.value},
      {"subcategory_id", optional_id(scope.subcategory_id)},
  };
}

nlohmann::json to_json(const domain::SequenceConfig& config) {
  nlohmann::json out;
  out["config_id"] = config.config_id.value;
  out["scope"] = to_json(config.scope);
  out["prefix"] = config.prefix;
  out["format"] = config.format;
  out["starting_number"] = config.starting_number;
  out["current_sequence"] = config.current_sequence;
  out["is_active"] = config.is_active;
  out["created_by"] = config.created_by;
  out["updated_by"] = config.updated_by;
  out["created_at"] = config.created_at;
  out["updated_at"] = config.updated_at;
  return out;
}

nlohmann::json to_json(const domain::SequenceFailure& failure) {
  return {
      {"code", domain::error_code_string(failure.code)},
      {"status", domain::suggested_status(failure.code)},
      {"message", failure.message},
  };
}

nlohmann::json to_json(const domain::Category& category) {
  return {
      {"category_id", category.category_id.value},
      {"name", category.name},
      {"slug", category.slug},
      {"parent_id", optional_id(category.parent_id)},
      {"level", category.level},
  };
}

nlohmann::json to_json(const domain::Machine& machine) {
  return {
      {"machine_id", machine.machine_id.value},
      {"name", machine.name},
      {"category_id", machine.category_id.value},
      {"subcategory_id", optional_id(machine.subcategory_id)},
      {"machine_sequence", machine.machine_sequence},
      {"deleted_at", optional_string(machine.deleted_at)},
  };
}

nlohmann::json to_json(const sequence::AllocationOutcome& outcome) {
  return {
      {"identifier", outcome.identifier},
      {"number", outcome.number},
      {"config_id", outcome.config_id.value},
      {"collisions_skipped", outcome.collisions_skipped},
  };
}

nlohmann::json to_json(const sequence::ReformatItem& item) {
  nlohmann::json out;
  out["machine_id"] = item.machine_id.value;
  out["old_identifier"] = item.old_identifier;
  out["new_identifier"] = optional_string(item.new_identifier);
  out["outcome"] = sequence::reformat_outcome_name(item.outcome);
  out["strategy"] = item.strategy.has_value()
                        ? nlohmann::json(sequence::strategy_name(*item.strategy))
                        : nlohmann::json(nullptr);
  if (!item.reason.empty()) {
    out["reason"] = item.reason;
  }
  return out;
}

nlohmann::json to_json(const sequence::ReformatReport& report) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : report.items) {
    items.push_back(to_json(item));
  }
  return {
      {"updated", report.updated},
      {"unchanged", report.unchanged},
      {"undecodable", report.undecodable},
      {"failed", report.failed},
      {"dry_run", report.dry_run},
      {"items", items},
  };
}

nlohmann::json to_json(const sequence::FormatSwapReport& report) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : report.items) {
    nlohmann::json entry;
    entry["config_id"] = item.config_id.value;
    entry["old_format"] = item.old_format;
    entry["new_format"] = optional_string(item.new_format);
    if (!item.error.empty()) {
      entry["error"] = item.error;
    }
    items.push_back(entry);
  }
  return {
      {"updated", report.updated},
      {"skipped", report.skipped},
      {"failed", report.failed},
      {"preview", report.preview},
      {"items", items},
  };
}

nlohmann::json to_json(const storage::AuditEvent& event) {
  nlohmann::json out;
  out["event_id"] = event.event_id;
  out["trace_id"] = event.trace_id;
  out["event_type"] = event.event_type;
  out["created_at"] = event.created_at;
  out["refs"] = event.refs;
  // Payloads are JSON written by the service; keep raw text if one is not.
  auto payload = nlohmann::json::parse(event.payload, nullptr, false);
  out["payload"] = payload.is_discarded() ? nlohmann::json(event.payload) : payload;
  return out;
}

}  // namespace mseq::app
