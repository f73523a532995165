#include "mseq/storage/audit_log.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mseq;

TEST_CASE("InMemoryAuditLog: append and query by trace", "[audit]") {
  storage::InMemoryAuditLog audit_log;

  REQUIRE(audit_log
              .append({"evt-1", "trace-a", "SequenceIssued", "{}", "2026-01-01T00:00:00Z", {}})
              .has_value());
  REQUIRE(audit_log
              .append({"evt-2", "trace-b", "SequenceReset", "{}", "2026-01-01T00:00:01Z",
                       {"seqcfg-1"}})
              .has_value());
  REQUIRE(audit_log
              .append({"evt-3", "trace-a", "SequenceIssued", "{}", "2026-01-01T00:00:02Z", {}})
              .has_value());

  const auto trace_a = audit_log.query("trace-a");
  REQUIRE(trace_a.size() == 2);
  CHECK(trace_a[0].event_id == "evt-1");
  CHECK(trace_a[1].event_id == "evt-3");

  const auto trace_b = audit_log.query("trace-b");
  REQUIRE(trace_b.size() == 1);
  CHECK(trace_b[0].refs == std::vector<std::string>{"seqcfg-1"});

  CHECK(audit_log.query("").size() == 3);
  CHECK(audit_log.query("trace-missing").empty());
  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-a", "trace-b"});
}

TEST_CASE("InMemoryAuditLog: reused event id is refused", "[audit]") {
  storage::InMemoryAuditLog audit_log;
  REQUIRE(audit_log
              .append({"evt-1", "trace-a", "SequenceIssued", "{}", "2026-01-01T00:00:00Z", {}})
              .has_value());

  const auto again =
      audit_log.append({"evt-1", "trace-b", "SequenceIssued", "{}", "2026-01-01T00:00:01Z", {}});
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error() == core::StorageError::kConflict);
  CHECK(audit_log.query("").size() == 1);
  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-a"});
}

TEST_CASE("audit_event_type_name: stored names", "[audit]") {
  using storage::AuditEventType;
  CHECK(std::string(storage::audit_event_type_name(AuditEventType::kSequenceIssued)) ==
        "SequenceIssued");
  CHECK(std::string(storage::audit_event_type_name(AuditEventType::kReformatItemFailed)) ==
        "ReformatItemFailed");
  CHECK(std::string(storage::audit_event_type_name(AuditEventType::kFormatSwapApplied)) ==
        "FormatSwapApplied");
}
