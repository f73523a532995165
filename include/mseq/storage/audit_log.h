#pragma once

#include "mseq/core/result.h"
#include "mseq/storage/audit_event.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mseq::storage {

// Append-only event log. Events of one trace read back in append order.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;

  // kConflict for a reused event_id, kUnavailable when the backend refuses the write.
  [[nodiscard]] virtual core::Result<bool, core::StorageError> append(const AuditEvent& event) = 0;

  // An empty trace_id returns the whole log in append order.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;

  // Sorted, distinct.
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  [[nodiscard]] core::Result<bool, core::StorageError> append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
  // trace_id -> positions in events_
  std::map<std::string, std::vector<std::size_t>> by_trace_;
  std::map<std::string, std::size_t> by_event_id_;
};

}  // namespace mseq::storage
