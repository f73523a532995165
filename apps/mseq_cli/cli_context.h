#pragma once

#include "cli_config.h"

#include "mseq/core/clock.h"
#include "mseq/core/id_generator.h"
#include "mseq/core/result.h"
#include "mseq/core/services.h"
#include "mseq/domain/sequence_error.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mseq::storage::sqlite {
class SqliteDb;
}

namespace mseq::cli {

// CliContext owns the concrete backends behind core::Services for one CLI run.
// Categories, machines and the audit log always live in SQLite; the sequence
// counters live in SQLite or Redis depending on --counter-backend.
class CliContext {
 public:
  // Opens the database, applies schema v1 and connects the counter backend.
  // Returns a printable error message on failure.
  [[nodiscard]] static core::Result<std::unique_ptr<CliContext>, std::string> open(
      const CliConfig& config);

  ~CliContext();

  CliContext(const CliContext&) = delete;
  CliContext& operator=(const CliContext&) = delete;
  CliContext(CliContext&&) = delete;
  CliContext& operator=(CliContext&&) = delete;

  [[nodiscard]] core::Services& services() { return *services_; }
  [[nodiscard]] core::IIdGenerator& id_gen() { return id_gen_; }
  [[nodiscard]] core::IClock& clock() { return clock_; }
  [[nodiscard]] const CliConfig& config() const { return config_; }

 private:
  explicit CliContext(CliConfig config);

  CliConfig config_;
  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  std::unique_ptr<storage::ICategoryDirectory> categories_;
  std::unique_ptr<storage::IMachineRepository> machines_;
  std::unique_ptr<storage::ISequenceConfigStore> configs_;
  std::unique_ptr<storage::IAuditLog> audit_log_;
  std::unique_ptr<core::Services> services_;

  core::SystemIdGenerator id_gen_;
  core::SystemClock clock_;
};

// Writes {"trace_id", "result"} to stdout and returns 0.
int print_success(const std::string& trace_id, const nlohmann::json& result);

// Writes {"trace_id", "error"} to stderr and returns 1.
int print_failure(const std::string& trace_id, const domain::SequenceFailure& failure);

// Warns on stderr when a use case could not record all of its audit events.
void warn_audit_dropped(const std::string& trace_id, int dropped);

// Prints parse errors (if any) followed by usage. Returns true when parsing failed.
bool report_parse_errors(const std::vector<std::string>& errors, const std::string& usage);

// Parses a decimal integer flag value; nullopt on garbage or overflow.
[[nodiscard]] std::optional<std::int64_t> parse_int64(const std::string& value);

}  // namespace mseq::cli
