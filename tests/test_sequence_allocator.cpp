#include "mseq/sequence/sequence_allocator.h"
#include "mseq/storage/inmemory_category_directory.h"
#include "mseq/storage/inmemory_machine_repository.h"
#include "mseq/storage/inmemory_sequence_config_store.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <mutex>
#include <set>
#include <stop_token>
#include <thread>
#include <vector>

using namespace mseq;
using domain::SequenceError;

namespace {

const core::CategoryId kServers{"cat-srv"};
const core::CategoryId kWeb{"cat-web"};

struct AllocatorFixture {
  storage::InMemorySequenceConfigStore configs;
  storage::InMemoryCategoryDirectory categories;
  storage::InMemoryMachineRepository machines;

  AllocatorFixture() {
    categories.upsert({kServers, "Servers", "srv", std::nullopt, 0});
    categories.upsert({kWeb, "Web", "web", kServers, 1});
  }

  domain::SequenceConfig add_config(const std::string& id, domain::SequenceScope scope,
                                    const std::string& format, std::int64_t current) {
    domain::SequenceConfig config;
    config.config_id = core::ConfigId{id};
    config.scope = std::move(scope);
    config.prefix = "SRV";
    config.format = format;
    config.starting_number = 1;
    config.current_sequence = current;
    config.created_at = "2026-01-01T00:00:00Z";
    config.updated_at = config.created_at;
    auto created = configs.create(config);
    REQUIRE(created.has_value());
    return created.value();
  }

  void add_machine(const std::string& id, const std::string& identifier) {
    machines.upsert({core::MachineId{id}, id, kServers, std::nullopt, identifier, std::nullopt});
  }
};

// Delegates to an in-memory store; every compare_and_advance first lets a
// simulated competitor claim one number, so the caller always loses the swap
// while `steals` lasts.
class CompetingStore final : public storage::ISequenceConfigStore {
 public:
  CompetingStore(storage::ISequenceConfigStore& inner, int steals) : inner_(inner), steals_(steals) {}

  core::Result<domain::SequenceConfig, core::StorageError> create(
      const domain::SequenceConfig& config) override {
    return inner_.create(config);
  }
  std::optional<domain::SequenceConfig> get(const core::ConfigId& id) const override {
    return inner_.get(id);
  }
  std::optional<domain::SequenceConfig> find_exact(
      const domain::SequenceScope& scope) const override {
    return inner_.find_exact(scope);
  }
  std::vector<domain::SequenceConfig> list_all() const override { return inner_.list_all(); }
  core::Result<domain::SequenceConfig, core::StorageError> update(
      const domain::SequenceConfig& config, storage::CounterWrite counter_write) override {
    return inner_.update(config, counter_write);
  }
  core::Result<domain::SequenceConfig, core::StorageError> advance(
      const core::ConfigId& id, std::int64_t new_current_sequence) override {
    return inner_.advance(id, new_current_sequence);
  }
  core::Result<domain::SequenceConfig, core::StorageError> compare_and_advance(
      const core::ConfigId& id, std::int64_t expected, std::int64_t new_current_sequence) override {
    if (steals_ > 0) {
      --steals_;
      const auto current = inner_.get(id);
      REQUIRE(current.has_value());
      REQUIRE(inner_.advance(id, current->current_sequence + 1).has_value());
    }
    return inner_.compare_and_advance(id, expected, new_current_sequence);
  }
  core::Result<domain::SequenceConfig, core::StorageError> remove(
      const core::ConfigId& id) override {
    return inner_.remove(id);
  }

 private:
  storage::ISequenceConfigStore& inner_;
  int steals_;
};

}  // namespace

TEST_CASE("SequenceAllocator: skips identifiers held by live machines", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 0);
  for (int n = 1; n <= 5; ++n) {
    f.add_machine("m-" + std::to_string(n), "SRV-00" + std::to_string(n));
  }

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);
  const auto result = allocator.generate({kServers, std::nullopt});

  REQUIRE(result.has_value());
  CHECK(result.value().identifier == "SRV-006");
  CHECK(result.value().number == 6);
  CHECK(result.value().collisions_skipped == 5);
  CHECK(result.value().config_id.value == "cfg-srv");
  CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == 6);
}

TEST_CASE("SequenceAllocator: counter ahead of issued identifiers", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 5);
  for (int n = 1; n <= 6; ++n) {
    f.add_machine("m-" + std::to_string(n), "SRV-00" + std::to_string(n));
  }

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);
  const auto result = allocator.generate({kServers, std::nullopt});

  REQUIRE(result.has_value());
  CHECK(result.value().identifier == "SRV-007");
  CHECK(result.value().collisions_skipped == 1);
  CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == 7);
}

TEST_CASE("SequenceAllocator: deleted machines do not block identifiers", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 0);
  f.add_machine("m-1", "SRV-001");
  REQUIRE(f.machines.soft_delete(core::MachineId{"m-1"}, "2026-01-02T00:00:00Z").has_value());

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);
  const auto result = allocator.generate({kServers, std::nullopt});
  REQUIRE(result.has_value());
  CHECK(result.value().identifier == "SRV-001");
}

TEST_CASE("SequenceAllocator: subcategory falls back to the category-wide counter",
          "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{subcategory}-{sequence}", 0);

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);
  const auto result = allocator.generate({kServers, kWeb});

  REQUIRE(result.has_value());
  CHECK(result.value().identifier == "SRV-WEB-001");
  CHECK(result.value().config_id.value == "cfg-srv");
}

TEST_CASE("SequenceAllocator: exact subcategory config wins over fallback", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 0);
  f.add_config("cfg-web", {kServers, kWeb}, "{category}-{subcategory}-{sequence}", 41);

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);
  const auto result = allocator.generate({kServers, kWeb});

  REQUIRE(result.has_value());
  CHECK(result.value().identifier == "SRV-WEB-042");
  CHECK(result.value().config_id.value == "cfg-web");
  CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == 0);
}

TEST_CASE("SequenceAllocator: inactive exact config falls back", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{subcategory}-{sequence}", 0);
  auto web = f.add_config("cfg-web", {kServers, kWeb}, "{category}-{subcategory}-{sequence}", 0);
  web.is_active = false;
  REQUIRE(f.configs.update(web, storage::CounterWrite::kKeep).has_value());

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);
  const auto result = allocator.generate({kServers, kWeb});
  REQUIRE(result.has_value());
  CHECK(result.value().config_id.value == "cfg-srv");
}

TEST_CASE("SequenceAllocator: no config for scope", "[allocator]") {
  AllocatorFixture f;
  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);

  const auto result = allocator.generate({kServers, kWeb});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == SequenceError::kConfigNotFound);
}

TEST_CASE("SequenceAllocator: missing category reference", "[allocator]") {
  AllocatorFixture f;
  const core::CategoryId ghost{"cat-ghost"};
  f.add_config("cfg-ghost", {ghost, std::nullopt}, "{category}-{sequence}", 0);

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);
  const auto result = allocator.generate({ghost, std::nullopt});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == SequenceError::kReferenceNotFound);
}

TEST_CASE("SequenceAllocator: exhausted probes leave the counter untouched", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 0);
  for (int n = 1; n <= 3; ++n) {
    f.add_machine("m-" + std::to_string(n), "SRV-00" + std::to_string(n));
  }

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines, {3, 16});
  const auto result = allocator.generate({kServers, std::nullopt});

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == SequenceError::kGenerationExhausted);
  CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == 0);
}

TEST_CASE("SequenceAllocator: counter at the largest number stops instead of wrapping",
          "[allocator]") {
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", kMax - 1);
  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);

  SECTION("the last number is still issued once") {
    const auto first = allocator.generate({kServers, std::nullopt});
    REQUIRE(first.has_value());
    CHECK(first.value().identifier == "SRV-9223372036854775807");
    CHECK(first.value().number == kMax);

    const auto second = allocator.generate({kServers, std::nullopt});
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code == SequenceError::kGenerationExhausted);
    CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == kMax);
  }

  SECTION("a collision on the last number does not wrap around") {
    f.add_machine("m-1", "SRV-9223372036854775807");
    const auto result = allocator.generate({kServers, std::nullopt});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == SequenceError::kGenerationExhausted);
    CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == kMax - 1);
  }
}

TEST_CASE("SequenceAllocator: cancellation before commit consumes nothing", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 9);

  std::stop_source source;
  source.request_stop();

  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines);
  const auto result = allocator.generate({kServers, std::nullopt}, source.get_token());

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == SequenceError::kCancelled);
  CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == 9);
}

TEST_CASE("SequenceAllocator: lost swap re-reads the counter", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 0);
  CompetingStore competing(f.configs, 1);

  sequence::SequenceAllocator allocator(competing, f.categories, f.machines);
  const auto result = allocator.generate({kServers, std::nullopt});

  REQUIRE(result.has_value());
  CHECK(result.value().number == 2);
  CHECK(result.value().identifier == "SRV-002");
  CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == 2);
}

TEST_CASE("SequenceAllocator: persistent contention is reported", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 0);
  CompetingStore competing(f.configs, 100);

  sequence::SequenceAllocator allocator(competing, f.categories, f.machines, {1000, 2});
  const auto result = allocator.generate({kServers, std::nullopt});

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == SequenceError::kCounterContention);
}

TEST_CASE("SequenceAllocator: concurrent generation issues distinct numbers", "[allocator]") {
  AllocatorFixture f;
  f.add_config("cfg-srv", {kServers, std::nullopt}, "{category}-{sequence}", 0);
  sequence::SequenceAllocator allocator(f.configs, f.categories, f.machines, {1000, 10000});

  constexpr int kThreads = 4;
  constexpr int kPerThread = 25;
  std::mutex mutex;
  std::set<std::int64_t> numbers;
  int failures = 0;

  {
    std::vector<std::jthread> workers;
    for (int t = 0; t < kThreads; ++t) {
      workers.emplace_back([&] {
        for (int i = 0; i < kPerThread; ++i) {
          const auto result = allocator.generate({kServers, std::nullopt});
          std::lock_guard<std::mutex> lock(mutex);
          if (result.has_value()) {
            numbers.insert(result.value().number);
          } else {
            ++failures;
          }
        }
      });
    }
  }

  CHECK(failures == 0);
  CHECK(numbers.size() == static_cast<std::size_t>(kThreads * kPerThread));
  CHECK(*numbers.rbegin() == kThreads * kPerThread);
  CHECK(f.configs.get(core::ConfigId{"cfg-srv"})->current_sequence == kThreads * kPerThread);
}
