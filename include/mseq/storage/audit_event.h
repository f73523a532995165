#pragma once

#include <string>
#include <vector>

namespace mseq::storage {

enum class AuditEventType {
  kSequenceConfigCreated,
  kSequenceConfigUpdated,
  kSequenceReset,
  kSequenceConfigDeleted,
  kSequenceIssued,
  kSequenceGenerationFailed,
  kReformatStarted,
  kReformatItemFailed,
  kReformatCompleted,
  kFormatSwapApplied,
};

// Stored name, e.g. "SequenceIssued".
[[nodiscard]] const char* audit_event_type_name(AuditEventType type);

// One recorded state change. payload is a JSON object; refs are the ids of the
// configs, machines and categories involved. event_type stays a string so that
// rows written by other versions still read back.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace mseq::storage
