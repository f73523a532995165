#include "mseq/storage/audit_log.h"

namespace mseq::storage {

const char* audit_event_type_name(AuditEventType type) {
  switch (type) {
    case AuditEventType::kSequenceConfigCreated:
      return "SequenceConfigCreated";
    case AuditEventType::kSequenceConfigUpdated:
      return "SequenceConfigUpdated";
    case AuditEventType::kSequenceReset:
      return "SequenceReset";
    case AuditEventType::kSequenceConfigDeleted:
      return "SequenceConfigDeleted";
    case AuditEventType::kSequenceIssued:
      return "SequenceIssued";
    case AuditEventType::kSequenceGenerationFailed:
      return "SequenceGenerationFailed";
    case AuditEventType::kReformatStarted:
      return "ReformatStarted";
    case AuditEventType::kReformatItemFailed:
      return "ReformatItemFailed";
    case AuditEventType::kReformatCompleted:
      return "ReformatCompleted";
    case AuditEventType::kFormatSwapApplied:
      return "FormatSwapApplied";
  }
  return "Unknown";
}

core::Result<bool, core::StorageError> InMemoryAuditLog::append(const AuditEvent& event) {
  using R = core::Result<bool, core::StorageError>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (by_event_id_.contains(event.event_id)) {
    return R::err(core::StorageError::kConflict);
  }
  const std::size_t position = events_.size();
  events_.push_back(event);
  by_event_id_.emplace(event.event_id, position);
  by_trace_[event.trace_id].push_back(position);
  return R::ok(true);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trace_id.empty()) {
    return events_;
  }
  const auto it = by_trace_.find(trace_id);
  if (it == by_trace_.end()) {
    return {};
  }
  std::vector<AuditEvent> trace;
  trace.reserve(it->second.size());
  for (const std::size_t position : it->second) {
    trace.push_back(events_[position]);
  }
  return trace;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(by_trace_.size());
  for (const auto& [trace_id, positions] : by_trace_) {
    ids.push_back(trace_id);
  }
  return ids;
}

}  // namespace mseq::storage
