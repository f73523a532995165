#include "cli_context.h"

#include "mseq/counter/redis_config.h"
#include "mseq/counter/redis_sequence_config_store.h"
#include "mseq/storage/sqlite/sqlite_audit_log.h"
#include "mseq/storage/sqlite/sqlite_category_directory.h"
#include "mseq/storage/sqlite/sqlite_db.h"
#include "mseq/storage/sqlite/sqlite_machine_repository.h"
#include "mseq/storage/sqlite/sqlite_sequence_config_store.h"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace mseq::cli {

CliContext::CliContext(CliConfig config) : config_(std::move(config)) {}

CliContext::~CliContext() = default;

core::Result<std::unique_ptr<CliContext>, std::string> CliContext::open(const CliConfig& config) {
  using OpenResult = core::Result<std::unique_ptr<CliContext>, std::string>;

  const std::filesystem::path db_path{config.db_path};
  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      return OpenResult::err("Failed to create directory " + db_path.parent_path().string() +
                             ": " + ec.message());
    }
  }

  auto db_result = storage::sqlite::SqliteDb::open(config.db_path);
  if (!db_result.has_value()) {
    return OpenResult::err("Failed to open database: " + db_result.error());
  }
  auto db = db_result.value();

  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    return OpenResult::err("Failed to initialize schema: " + schema_result.error());
  }

  std::unique_ptr<CliContext> ctx(new CliContext(config));
  ctx->db_ = db;
  ctx->categories_ = std::make_unique<storage::sqlite::SqliteCategoryDirectory>(db);
  ctx->machines_ = std::make_unique<storage::sqlite::SqliteMachineRepository>(db);
  ctx->audit_log_ = std::make_unique<storage::sqlite::SqliteAuditLog>(db);

  if (config.counter_backend == CounterBackend::kRedis) {
    // validate_cli_config guarantees a parseable URI here.
    const auto redis_config = counter::parse_redis_uri(config.redis_uri.value_or(""));
    if (!redis_config.has_value()) {
      return OpenResult::err("Invalid Redis URI: " + config.redis_uri.value_or(""));
    }
    try {
      ctx->configs_ = std::make_unique<counter::RedisSequenceConfigStore>(redis_config.value());
    } catch (const std::runtime_error& e) {
      return OpenResult::err(e.what());
    }
    std::cerr << "Counter backend: redis ("
              << counter::redis_config_to_log_string(redis_config.value()) << ")\n";
  } else {
    ctx->configs_ = std::make_unique<storage::sqlite::SqliteSequenceConfigStore>(db);
  }

  ctx->services_ = std::make_unique<core::Services>(*ctx->configs_, *ctx->categories_,
                                                    *ctx->machines_, *ctx->audit_log_);
  return OpenResult::ok(std::move(ctx));
}

int print_success(const std::string& trace_id, const nlohmann::json& result) {
  nlohmann::json out;
  out["trace_id"] = trace_id;
  out["result"] = result;
  std::cout << out.dump(2) << "\n";
  return 0;
}

int print_failure(const std::string& trace_id, const domain::SequenceFailure& failure) {
  nlohmann::json out;
  out["trace_id"] = trace_id;
  out["error"] = {{"code", domain::error_code_string(failure.code)},
                  {"status", domain::suggested_status(failure.code)},
                  {"message", failure.message}};
  std::cerr << out.dump(2) << "\n";
  return 1;
}

void warn_audit_dropped(const std::string& trace_id, int dropped) {
  if (dropped > 0) {
    std::cerr << "Warning: " << dropped << " audit event(s) of trace " << trace_id
              << " were not recorded\n";
  }
}

bool report_parse_errors(const std::vector<std::string>& errors, const std::string& usage) {
  if (errors.empty()) {
    return false;
  }
  for (const auto& error : errors) {
    std::cerr << "Error: " << error << "\n";
  }
  std::cerr << usage;
  return true;
}

std::optional<std::int64_t> parse_int64(const std::string& value) {
  std::int64_t parsed = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last || value.empty()) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace mseq::cli
