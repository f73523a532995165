#include "mseq/app/sequence_service.h"
#include "mseq/core/clock.h"
#include "mseq/core/id_generator.h"
#include "mseq/core/services.h"
#include "mseq/storage/audit_log.h"
#include "mseq/storage/inmemory_category_directory.h"
#include "mseq/storage/inmemory_machine_repository.h"
#include "mseq/storage/inmemory_sequence_config_store.h"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

using namespace mseq;
using domain::SequenceError;

namespace {

const core::CategoryId kServers{"cat-srv"};
const core::CategoryId kWeb{"cat-web"};

struct ServiceFixture {
  storage::InMemorySequenceConfigStore configs;
  storage::InMemoryCategoryDirectory categories;
  storage::InMemoryMachineRepository machines;
  storage::InMemoryAuditLog audit_log;
  core::Services services{configs, categories, machines, audit_log};
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};

  ServiceFixture() {
    categories.upsert({kServers, "Servers", "srv", std::nullopt, 0});
    categories.upsert({kWeb, "Web", "web", kServers, 1});
  }

  domain::SequenceConfig create_config(std::optional<core::CategoryId> sub = std::nullopt,
                                       const std::string& format = "{category}-{sequence}") {
    app::CreateConfigCommand cmd{{{kServers, std::move(sub)}, "srv", format, 1, "alice"},
                                 std::nullopt};
    auto created = app::run_create_config(cmd, services, id_gen, clock);
    REQUIRE(created.result.has_value());
    return created.result.value();
  }

  std::vector<std::string> event_types(const std::string& trace_id) const {
    std::vector<std::string> types;
    for (const auto& event : audit_log.query(trace_id)) {
      types.push_back(event.event_type);
    }
    return types;
  }
};

}  // namespace

// ── Config lifecycle ────────────────────────────────────────────────────────

TEST_CASE("run_create_config emits SequenceConfigCreated", "[app][config]") {
  ServiceFixture f;

  app::CreateConfigCommand cmd{{{kServers, std::nullopt}, "srv", "{category}-{sequence}", 1,
                                "alice"},
                               std::string("trace-create")};
  const auto response = app::run_create_config(cmd, f.services, f.id_gen, f.clock);

  CHECK(response.trace_id == "trace-create");
  REQUIRE(response.result.has_value());

  const auto events = f.audit_log.query("trace-create");
  REQUIRE(events.size() == 1);
  CHECK(events[0].event_type == "SequenceConfigCreated");
  CHECK(events[0].refs.front() == response.result.value().config_id.value);

  const auto payload = nlohmann::json::parse(events[0].payload);
  CHECK(payload["config"]["prefix"] == "SRV");
}

TEST_CASE("run_create_config failure emits nothing", "[app][config]") {
  ServiceFixture f;
  f.create_config();

  app::CreateConfigCommand cmd{{{kServers, std::nullopt}, "srv", "{category}-{sequence}", 1,
                                "alice"},
                               std::string("trace-dup")};
  const auto response = app::run_create_config(cmd, f.services, f.id_gen, f.clock);

  REQUIRE_FALSE(response.result.has_value());
  CHECK(response.result.error().code == SequenceError::kDuplicateConfig);
  CHECK(f.audit_log.query("trace-dup").empty());
}

TEST_CASE("run_create_config generates a trace id when none is given", "[app][config]") {
  ServiceFixture f;

  app::CreateConfigCommand cmd{{{kServers, std::nullopt}, "srv", "{category}-{sequence}", 1,
                                "alice"},
                               std::nullopt};
  const auto response = app::run_create_config(cmd, f.services, f.id_gen, f.clock);

  CHECK(response.trace_id.starts_with("trace-"));
  CHECK(f.audit_log.query(response.trace_id).size() == 1);
}

TEST_CASE("run_update_config and run_reset_sequence", "[app][config]") {
  ServiceFixture f;
  const auto config = f.create_config();

  SECTION("prefix-only update keeps the counter") {
    REQUIRE(f.configs.advance(config.config_id, 5).has_value());

    app::UpdateConfigCommand cmd{config.config_id, {}, false, std::string("trace-upd")};
    cmd.update.prefix = "host";
    cmd.update.updated_by = "bob";
    const auto response = app::run_update_config(cmd, f.services, f.id_gen, f.clock);

    REQUIRE(response.result.has_value());
    const auto& outcome = response.result.value();
    CHECK(outcome.change.after.prefix == "HOST");
    CHECK(outcome.change.after.current_sequence == 5);
    CHECK_FALSE(outcome.change.template_changed());
    CHECK_FALSE(outcome.reformat.has_value());
    CHECK(f.event_types("trace-upd") == std::vector<std::string>{"SequenceConfigUpdated"});
  }

  SECTION("reset rewinds the counter") {
    REQUIRE(f.configs.advance(config.config_id, 9).has_value());

    app::ResetSequenceCommand cmd{config.config_id, 100, "bob", std::string("trace-reset")};
    const auto response = app::run_reset_sequence(cmd, f.services, f.id_gen, f.clock);

    REQUIRE(response.result.has_value());
    CHECK(response.result.value().starting_number == 100);
    CHECK(response.result.value().current_sequence == 99);
    CHECK(f.event_types("trace-reset") == std::vector<std::string>{"SequenceReset"});
  }

  SECTION("unknown config") {
    app::UpdateConfigCommand cmd{core::ConfigId{"seqcfg-missing"}, {}, false,
                                 std::string("trace-missing")};
    cmd.update.updated_by = "bob";
    const auto response = app::run_update_config(cmd, f.services, f.id_gen, f.clock);

    REQUIRE_FALSE(response.result.has_value());
    CHECK(response.result.error().code == SequenceError::kConfigNotFound);
    CHECK(f.audit_log.query("trace-missing").empty());
  }
}

TEST_CASE("run_update_config with reformat re-renders machines", "[app][config][reformat]") {
  ServiceFixture f;
  const auto config = f.create_config();
  f.machines.upsert({core::MachineId{"m-1"}, "a", kServers, std::nullopt, "SRV-001", std::nullopt});
  f.machines.upsert({core::MachineId{"m-2"}, "b", kServers, std::nullopt, "SRV-002", std::nullopt});

  app::UpdateConfigCommand cmd{config.config_id, {}, true, std::string("trace-fmt")};
  cmd.update.format = "{sequence}-{category}";
  cmd.update.updated_by = "bob";
  const auto response = app::run_update_config(cmd, f.services, f.id_gen, f.clock);

  REQUIRE(response.result.has_value());
  const auto& outcome = response.result.value();
  CHECK(outcome.change.template_changed());
  REQUIRE(outcome.reformat.has_value());
  CHECK(outcome.reformat->updated == 2);
  CHECK_FALSE(outcome.reformat_error.has_value());

  CHECK(f.machines.get(core::MachineId{"m-1"})->machine_sequence == "001-SRV");
  CHECK(f.machines.get(core::MachineId{"m-2"})->machine_sequence == "002-SRV");

  CHECK(f.event_types("trace-fmt") ==
        std::vector<std::string>{"SequenceConfigUpdated", "ReformatStarted", "ReformatCompleted"});
}

TEST_CASE("run_delete_config emits SequenceConfigDeleted", "[app][config]") {
  ServiceFixture f;
  const auto config = f.create_config();

  app::DeleteConfigCommand cmd{config.config_id, "carol", std::string("trace-del")};
  const auto response = app::run_delete_config(cmd, f.services, f.id_gen, f.clock);

  REQUIRE(response.result.has_value());
  CHECK_FALSE(f.configs.get(config.config_id).has_value());

  const auto events = f.audit_log.query("trace-del");
  REQUIRE(events.size() == 1);
  CHECK(events[0].event_type == "SequenceConfigDeleted");
  CHECK(nlohmann::json::parse(events[0].payload)["deleted_by"] == "carol");
}

// ── Identifier allocation ───────────────────────────────────────────────────

TEST_CASE("run_generate_identifier issues and audits", "[app][generate]") {
  ServiceFixture f;
  f.create_config(kWeb, "{category}-{subcategory}-{sequence}");

  app::GenerateIdentifierCommand cmd{{kServers, kWeb}, std::string("trace-gen")};
  const auto first = app::run_generate_identifier(cmd, f.services, f.id_gen, f.clock);
  const auto second = app::run_generate_identifier(cmd, f.services, f.id_gen, f.clock);

  REQUIRE(first.result.has_value());
  REQUIRE(second.result.has_value());
  CHECK(first.result.value().identifier == "SRV-WEB-001");
  CHECK(second.result.value().identifier == "SRV-WEB-002");

  CHECK(f.event_types("trace-gen") ==
        std::vector<std::string>{"SequenceIssued", "SequenceIssued"});
}

TEST_CASE("run_generate_identifier failure is audited", "[app][generate]") {
  ServiceFixture f;

  app::GenerateIdentifierCommand cmd{{kServers, std::nullopt}, std::string("trace-fail")};
  const auto response = app::run_generate_identifier(cmd, f.services, f.id_gen, f.clock);

  REQUIRE_FALSE(response.result.has_value());
  CHECK(response.result.error().code == SequenceError::kConfigNotFound);

  const auto events = f.audit_log.query("trace-fail");
  REQUIRE(events.size() == 1);
  CHECK(events[0].event_type == "SequenceGenerationFailed");
  const auto payload = nlohmann::json::parse(events[0].payload);
  CHECK(payload["error"]["code"] == "SEQUENCE_MANAGEMENT_NOT_FOUND");
}

TEST_CASE("run_assign_identifier stores the identifier on the machine", "[app][assign]") {
  ServiceFixture f;
  f.create_config();
  f.machines.upsert({core::MachineId{"m-1"}, "a", kServers, std::nullopt, "SRV-001", std::nullopt});
  f.machines.upsert({core::MachineId{"m-2"}, "b", kServers, std::nullopt, "", std::nullopt});

  SECTION("skips identifiers held by live machines") {
    app::AssignIdentifierCommand cmd{core::MachineId{"m-2"}, std::string("trace-assign")};
    const auto response = app::run_assign_identifier(cmd, f.services, f.id_gen, f.clock);

    REQUIRE(response.result.has_value());
    CHECK(response.result.value().identifier == "SRV-002");
    CHECK(response.result.value().collisions_skipped == 1);
    CHECK(f.machines.get(core::MachineId{"m-2"})->machine_sequence == "SRV-002");
    CHECK(f.event_types("trace-assign") == std::vector<std::string>{"SequenceIssued"});
  }

  SECTION("unknown machine") {
    app::AssignIdentifierCommand cmd{core::MachineId{"m-x"}, std::string("trace-nomachine")};
    const auto response = app::run_assign_identifier(cmd, f.services, f.id_gen, f.clock);

    REQUIRE_FALSE(response.result.has_value());
    CHECK(response.result.error().code == SequenceError::kReferenceNotFound);
    CHECK(f.event_types("trace-nomachine") ==
          std::vector<std::string>{"SequenceGenerationFailed"});
  }

  SECTION("deleted machine") {
    REQUIRE(f.machines.soft_delete(core::MachineId{"m-2"}, "2026-01-02T00:00:00Z").has_value());
    app::AssignIdentifierCommand cmd{core::MachineId{"m-2"}, std::nullopt};
    const auto response = app::run_assign_identifier(cmd, f.services, f.id_gen, f.clock);

    REQUIRE_FALSE(response.result.has_value());
    CHECK(response.result.error().code == SequenceError::kReferenceNotFound);
  }
}

// ── Migrations ──────────────────────────────────────────────────────────────

TEST_CASE("run_reformat dry run leaves machines untouched", "[app][reformat]") {
  ServiceFixture f;
  f.machines.upsert({core::MachineId{"m-1"}, "a", kServers, std::nullopt, "SRV-007", std::nullopt});

  app::ReformatCommand cmd{
      {{kServers, std::nullopt}, "{category}-{sequence}", "{sequence}-{category}", true},
      "alice",
      std::string("trace-dry")};
  const auto response = app::run_reformat(cmd, f.services, f.id_gen, f.clock);

  REQUIRE(response.result.has_value());
  CHECK(response.result.value().dry_run);
  CHECK(response.result.value().updated == 1);
  REQUIRE(response.result.value().items.size() == 1);
  CHECK(response.result.value().items[0].new_identifier == std::optional<std::string>("007-SRV"));
  CHECK(f.machines.get(core::MachineId{"m-1"})->machine_sequence == "SRV-007");

  CHECK(f.event_types("trace-dry") ==
        std::vector<std::string>{"ReformatStarted", "ReformatCompleted"});
}

TEST_CASE("run_reformat reports collisions per item", "[app][reformat]") {
  ServiceFixture f;
  f.machines.upsert({core::MachineId{"m-1"}, "a", kServers, std::nullopt, "SRV-007", std::nullopt});
  // Holds the target identifier but lives outside the reformatted scope.
  f.machines.upsert({core::MachineId{"m-2"}, "b", kServers, kWeb, "007-SRV", std::nullopt});

  app::ReformatCommand cmd{
      {{kServers, std::nullopt}, "{category}-{sequence}", "{sequence}-{category}", false},
      "alice",
      std::string("trace-collide")};
  const auto response = app::run_reformat(cmd, f.services, f.id_gen, f.clock);

  REQUIRE(response.result.has_value());
  CHECK(response.result.value().failed == 1);
  CHECK(f.machines.get(core::MachineId{"m-1"})->machine_sequence == "SRV-007");
  CHECK(f.event_types("trace-collide") ==
        std::vector<std::string>{"ReformatStarted", "ReformatItemFailed", "ReformatCompleted"});
}

TEST_CASE("run_format_swap rewrites category-first templates", "[app][swap]") {
  ServiceFixture f;
  const auto config = f.create_config();

  SECTION("preview") {
    app::FormatSwapCommand cmd{true, "alice", std::string("trace-preview")};
    const auto response = app::run_format_swap(cmd, f.services, f.id_gen, f.clock);

    CHECK(response.trace_id == "trace-preview");
    CHECK(response.report.preview);
    CHECK(response.report.updated == 1);
    CHECK(f.configs.get(config.config_id)->format == "{category}-{sequence}");
    CHECK(f.event_types("trace-preview") == std::vector<std::string>{"FormatSwapApplied"});
  }

  SECTION("apply") {
    app::FormatSwapCommand cmd{false, "alice", std::string("trace-swap")};
    const auto response = app::run_format_swap(cmd, f.services, f.id_gen, f.clock);

    CHECK(response.report.updated == 1);
    CHECK(f.configs.get(config.config_id)->format == "{sequence}-{category}");

    const auto events = f.audit_log.query("trace-swap");
    REQUIRE(events.size() == 1);
    CHECK(events[0].refs == std::vector<std::string>{config.config_id.value});
  }
}

TEST_CASE("fetch_audit_trace returns one trace in order", "[app][audit]") {
  ServiceFixture f;
  f.create_config();

  app::GenerateIdentifierCommand cmd{{kServers, std::nullopt}, std::string("trace-fetch")};
  (void)app::run_generate_identifier(cmd, f.services, f.id_gen, f.clock);
  (void)app::run_generate_identifier(cmd, f.services, f.id_gen, f.clock);

  const auto events = app::fetch_audit_trace("trace-fetch", f.services);
  REQUIRE(events.size() == 2);
  CHECK(std::all_of(events.begin(), events.end(),
                    [](const auto& e) { return e.trace_id == "trace-fetch"; }));
  CHECK(nlohmann::json::parse(events[1].payload)["allocation"]["identifier"] == "SRV-002");
}

// ── Audit failures ──────────────────────────────────────────────────────────

namespace {

// Refuses every append.
class UnavailableAuditLog final : public storage::IAuditLog {
 public:
  core::Result<bool, core::StorageError> append(const storage::AuditEvent& /*event*/) override {
    ++attempts;
    return core::Result<bool, core::StorageError>::err(core::StorageError::kUnavailable);
  }
  std::vector<storage::AuditEvent> query(const std::string& /*trace_id*/) const override {
    return {};
  }
  std::vector<std::string> list_trace_ids() const override { return {}; }

  int attempts{0};
};

}  // namespace

TEST_CASE("A refused audit append does not fail the use case", "[app][audit]") {
  storage::InMemorySequenceConfigStore configs;
  storage::InMemoryCategoryDirectory categories;
  storage::InMemoryMachineRepository machines;
  UnavailableAuditLog audit_log;
  core::Services services{configs, categories, machines, audit_log};
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  categories.upsert({kServers, "Servers", "srv", std::nullopt, 0});

  app::CreateConfigCommand create{{{kServers, std::nullopt}, "srv", "{category}-{sequence}", 1,
                                   "alice"},
                                  std::nullopt};
  const auto created = app::run_create_config(create, services, id_gen, clock);
  REQUIRE(created.result.has_value());
  CHECK(created.audit_dropped == 1);

  SECTION("assign counts the drops of the nested generate") {
    machines.upsert({core::MachineId{"m-1"}, "a", kServers, std::nullopt, "", std::nullopt});
    const auto assigned =
        app::run_assign_identifier({core::MachineId{"m-1"}, std::nullopt}, services, id_gen, clock);
    REQUIRE(assigned.result.has_value());
    CHECK(assigned.result.value().identifier == "SRV-001");
    CHECK(assigned.audit_dropped == 1);
    CHECK(machines.get(core::MachineId{"m-1"})->machine_sequence == "SRV-001");
  }

  SECTION("format swap reports its dropped event") {
    const auto swapped = app::run_format_swap({false, "alice", std::nullopt}, services, id_gen,
                                              clock);
    CHECK(swapped.audit_dropped == 1);
    CHECK(audit_log.attempts == 2);
  }
}
