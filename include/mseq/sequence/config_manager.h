#pragma once

#include "mseq/core/clock.h"
#include "mseq/core/id_generator.h"
#include "mseq/domain/sequence_config.h"
#include "mseq/storage/repositories.h"
#include "mseq/storage/sequence_config_store.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mseq::sequence {

struct CreateConfigRequest {
  domain::SequenceScope scope;
  std::string prefix;
  std::string format;
  std::int64_t starting_number{1};
  std::string created_by;
};

// Partial update: absent fields keep their stored value.
struct ConfigUpdate {
  std::optional<std::string> prefix;
  std::optional<std::string> format;
  std::optional<std::int64_t> starting_number;
  std::optional<bool> is_active;
  std::string updated_by;
};

struct ConfigChange {
  domain::SequenceConfig before;
  domain::SequenceConfig after;

  [[nodiscard]] bool template_changed() const { return before.format != after.format; }
  [[nodiscard]] bool counter_reset() const {
    return before.current_sequence != after.current_sequence;
  }
};

// SequenceConfigManager owns the lifecycle of counter records.
//
// Validation order on create: template, starting number, prefix, category and
// subcategory existence, then uniqueness of the exact scope.
//
// Counter semantics:
// - create sets current_sequence = starting_number - 1
// - update resets the counter only when starting_number is given and differs;
//   a template-only update leaves numbering untouched
// - reset sets starting_number and current_sequence = new_start - 1 unconditionally
class SequenceConfigManager {
 public:
  SequenceConfigManager(storage::ISequenceConfigStore& store,
                        const storage::ICategoryDirectory& categories, core::IIdGenerator& id_gen,
                        core::IClock& clock);

  [[nodiscard]] domain::SequenceResult<domain::SequenceConfig> create(
      const CreateConfigRequest& request);

  [[nodiscard]] domain::SequenceResult<ConfigChange> update(const core::ConfigId& id,
                                                            const ConfigUpdate& update);

  [[nodiscard]] domain::SequenceResult<domain::SequenceConfig> reset(
      const core::ConfigId& id, std::int64_t new_starting_number, const std::string& updated_by);

  [[nodiscard]] domain::SequenceResult<domain::SequenceConfig> remove(const core::ConfigId& id);

  [[nodiscard]] std::optional<domain::SequenceConfig> get(const core::ConfigId& id) const;
  [[nodiscard]] std::optional<domain::SequenceConfig> get_exact(
      const domain::SequenceScope& scope) const;
  [[nodiscard]] std::vector<domain::SequenceConfig> list_all() const;

 private:
  storage::ISequenceConfigStore& store_;
  const storage::ICategoryDirectory& categories_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;

  [[nodiscard]] domain::SequenceResult<bool> validate_references(
      const domain::SequenceScope& scope) const;
};

}  // namespace mseq::sequence
