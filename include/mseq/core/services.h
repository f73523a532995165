#pragma once

#include "mseq/storage/audit_log.h"
#include "mseq/storage/repositories.h"
#include "mseq/storage/sequence_config_store.h"

namespace mseq::core {

// The four collaborators every use case runs against. Non-owning: the entry
// point (CliContext, a test fixture) owns the backends and outlives Services.
struct Services {
  storage::ISequenceConfigStore& configs;   // NOLINT(readability-identifier-naming)
  storage::ICategoryDirectory& categories;  // NOLINT(readability-identifier-naming)
  storage::IMachineRepository& machines;    // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;            // NOLINT(readability-identifier-naming)

  Services(storage::ISequenceConfigStore& configs, storage::ICategoryDirectory& categories,
           storage::IMachineRepository& machines, storage::IAuditLog& audit_log)
      : configs(configs), categories(categories), machines(machines), audit_log(audit_log) {}

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace mseq::core
