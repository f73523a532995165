#include "mseq/core/clock.h"
#include "mseq/core/id_generator.h"
#include "mseq/core/ids.h"

#include <catch2/catch_test_macros.hpp>

#include <type_traits>

TEST_CASE("ID generators produce non-empty values", "[ids]") {
  SECTION("SystemIdGenerator produces non-empty IDs") {
    mseq::core::SystemIdGenerator gen;
    const auto config_id = mseq::core::new_config_id(gen);
    const auto trace_id = mseq::core::new_trace_id(gen);

    REQUIRE_FALSE(config_id.value.empty());
    REQUIRE_FALSE(trace_id.value.empty());
    CHECK(config_id.value.starts_with("seqcfg-"));
    CHECK(trace_id.value.starts_with("trace-"));
    CHECK(config_id.value != trace_id.value);
  }

  SECTION("DeterministicIdGenerator replays the same sequence") {
    mseq::core::DeterministicIdGenerator first;
    mseq::core::DeterministicIdGenerator second;

    CHECK(mseq::core::new_config_id(first).value == "seqcfg-0");
    CHECK(first.next("evt") == "evt-1");
    CHECK(mseq::core::new_config_id(second).value == "seqcfg-0");
    CHECK(second.next("evt") == "evt-1");
  }
}

TEST_CASE("FixedClock returns the configured timestamp until moved", "[clock]") {
  mseq::core::FixedClock clock("2026-01-01T00:00:00Z");
  CHECK(clock.now_iso8601() == "2026-01-01T00:00:00Z");
  CHECK(clock.now_iso8601() == "2026-01-01T00:00:00Z");

  clock.set("2026-01-02T00:00:00Z");
  CHECK(clock.now_iso8601() == "2026-01-02T00:00:00Z");
}

TEST_CASE("SystemClock renders UTC ISO 8601", "[clock]") {
  mseq::core::SystemClock clock;
  const auto now = clock.now_iso8601();
  REQUIRE(now.size() == 20);
  CHECK(now[4] == '-');
  CHECK(now[10] == 'T');
  CHECK(now.back() == 'Z');
}

TEST_CASE("format_iso8601_utc renders fixed width", "[clock]") {
  const std::chrono::system_clock::time_point epoch{};
  CHECK(mseq::core::format_iso8601_utc(epoch) == "1970-01-01T00:00:00Z");
  CHECK(mseq::core::format_iso8601_utc(epoch + std::chrono::hours(24 * 365) +
                                       std::chrono::seconds(61)) == "1971-01-01T00:01:01Z");
}

TEST_CASE("DeterministicIdGenerator can start past zero", "[ids]") {
  mseq::core::DeterministicIdGenerator gen(100);
  CHECK(mseq::core::new_machine_id(gen).value == "mach-100");
  CHECK(mseq::core::new_event_id(gen) == "evt-101");
}

TEST_CASE("Strong ids: distinct types ordered by value", "[core][ids]") {
  STATIC_CHECK_FALSE(std::is_same_v<mseq::core::CategoryId, mseq::core::MachineId>);
  STATIC_CHECK_FALSE(std::is_convertible_v<mseq::core::ConfigId, mseq::core::MachineId>);

  CHECK(mseq::core::CategoryId{"cat-a"} < mseq::core::CategoryId{"cat-b"});
  CHECK(mseq::core::ConfigId{"seqcfg-1"} == mseq::core::ConfigId{"seqcfg-1"});
}
