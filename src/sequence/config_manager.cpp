#include "mseq/sequence/config_manager.h"

#include "mseq/sequence/sequence_template.h"

namespace mseq::sequence {

using domain::SequenceConfig;
using domain::SequenceError;
using domain::SequenceFailure;
using domain::SequenceResult;

namespace {

SequenceFailure not_found(const core::ConfigId& id) {
  return {SequenceError::kConfigNotFound, "Sequence configuration not found: " + id.value};
}

}  // namespace

SequenceConfigManager::SequenceConfigManager(storage::ISequenceConfigStore& store,
                                             const storage::ICategoryDirectory& categories,
                                             core::IIdGenerator& id_gen, core::IClock& clock)
    : store_(store), categories_(categories), id_gen_(id_gen), clock_(clock) {}

SequenceResult<bool> SequenceConfigManager::validate_references(
    const domain::SequenceScope& scope) const {
  if (!categories_.get(scope.category_id).has_value()) {
    return SequenceResult<bool>::err(
        {SequenceError::kReferenceNotFound, "Category not found: " + scope.category_id.value});
  }
  if (scope.subcategory_id.has_value() && !categories_.get(*scope.subcategory_id).has_value()) {
    return SequenceResult<bool>::err({SequenceError::kReferenceNotFound,
                                      "Subcategory not found: " + scope.subcategory_id->value});
  }
  return SequenceResult<bool>::ok(true);
}

SequenceResult<SequenceConfig> SequenceConfigManager::create(const CreateConfigRequest& request) {
  using R = SequenceResult<SequenceConfig>;

  if (auto tmpl = SequenceTemplate::parse(request.format); !tmpl.has_value()) {
    return R::err(tmpl.error());
  }
  if (auto start = domain::validate_starting_number(request.starting_number);
      !start.has_value()) {
    return R::err(start.error());
  }
  const std::string prefix = domain::normalize_prefix(request.prefix);
  if (auto valid = domain::validate_prefix(prefix); !valid.has_value()) {
    return R::err(valid.error());
  }
  if (auto refs = validate_references(request.scope); !refs.has_value()) {
    return R::err(refs.error());
  }
  if (store_.find_exact(request.scope).has_value()) {
    return R::err({SequenceError::kDuplicateConfig,
                   "Sequence configuration already exists for " +
                       domain::scope_to_string(request.scope)});
  }

  const std::string now = clock_.now_iso8601();
  SequenceConfig config;
  config.config_id = core::new_config_id(id_gen_);
  config.scope = request.scope;
  config.prefix = prefix;
  config.format = request.format;
  config.starting_number = request.starting_number;
  config.current_sequence = request.starting_number - 1;
  config.is_active = true;
  config.created_by = request.created_by;
  config.updated_by = request.created_by;
  config.created_at = now;
  config.updated_at = now;

  auto created = store_.create(config);
  if (!created.has_value()) {
    // A concurrent create for the same scope lost the race at the store.
    if (created.error() == core::StorageError::kConflict) {
      return R::err({SequenceError::kDuplicateConfig,
                     "Sequence configuration already exists for " +
                         domain::scope_to_string(request.scope)});
    }
    return R::err(domain::from_storage_error(created.error(), "Create sequence configuration"));
  }
  return R::ok(created.value());
}

SequenceResult<ConfigChange> SequenceConfigManager::update(const core::ConfigId& id,
                                                           const ConfigUpdate& update) {
  using R = SequenceResult<ConfigChange>;

  auto existing = store_.get(id);
  if (!existing.has_value()) {
    return R::err(not_found(id));
  }

  if (update.format.has_value()) {
    if (auto tmpl = SequenceTemplate::parse(*update.format); !tmpl.has_value()) {
      return R::err(tmpl.error());
    }
  }
  if (update.starting_number.has_value()) {
    if (auto start = domain::validate_starting_number(*update.starting_number);
        !start.has_value()) {
      return R::err(start.error());
    }
  }

  SequenceConfig next = *existing;
  if (update.prefix.has_value()) {
    next.prefix = domain::normalize_prefix(*update.prefix);
    if (auto valid = domain::validate_prefix(next.prefix); !valid.has_value()) {
      return R::err(valid.error());
    }
  }
  if (update.format.has_value()) {
    next.format = *update.format;
  }
  if (update.is_active.has_value()) {
    next.is_active = *update.is_active;
  }

  auto counter_write = storage::CounterWrite::kKeep;
  if (update.starting_number.has_value() && *update.starting_number != existing->starting_number) {
    next.starting_number = *update.starting_number;
    next.current_sequence = *update.starting_number - 1;
    counter_write = storage::CounterWrite::kOverwrite;
  }

  next.updated_by = update.updated_by;
  next.updated_at = clock_.now_iso8601();

  auto stored = store_.update(next, counter_write);
  if (!stored.has_value()) {
    return R::err(domain::from_storage_error(stored.error(), "Update sequence configuration"));
  }
  return R::ok(ConfigChange{*existing, stored.value()});
}

SequenceResult<SequenceConfig> SequenceConfigManager::reset(const core::ConfigId& id,
                                                            std::int64_t new_starting_number,
                                                            const std::string& updated_by) {
  using R = SequenceResult<SequenceConfig>;

  if (auto start = domain::validate_starting_number(new_starting_number); !start.has_value()) {
    return R::err(start.error());
  }

  auto existing = store_.get(id);
  if (!existing.has_value()) {
    return R::err(not_found(id));
  }

  SequenceConfig next = *existing;
  next.starting_number = new_starting_number;
  next.current_sequence = new_starting_number - 1;
  next.updated_by = updated_by;
  next.updated_at = clock_.now_iso8601();

  auto stored = store_.update(next, storage::CounterWrite::kOverwrite);
  if (!stored.has_value()) {
    return R::err(domain::from_storage_error(stored.error(), "Reset sequence"));
  }
  return R::ok(stored.value());
}

SequenceResult<SequenceConfig> SequenceConfigManager::remove(const core::ConfigId& id) {
  using R = SequenceResult<SequenceConfig>;

  auto removed = store_.remove(id);
  if (!removed.has_value()) {
    if (removed.error() == core::StorageError::kNotFound) {
      return R::err(not_found(id));
    }
    return R::err(domain::from_storage_error(removed.error(), "Delete sequence configuration"));
  }
  return R::ok(removed.value());
}

std::optional<SequenceConfig> SequenceConfigManager::get(const core::ConfigId& id) const {
  return store_.get(id);
}

std::optional<SequenceConfig> SequenceConfigManager::get_exact(
    const domain::SequenceScope& scope) const {
  return store_.find_exact(scope);
}

std::vector<SequenceConfig> SequenceConfigManager::list_all() const { return store_.list_all(); }

}  // namespace mseq::sequence
