#pragma once

#include "mseq/counter/redis_config.h"

#include <string>

namespace mseq::counter {

struct CounterBackendStatus {
  bool reachable{false};
  long long config_count{0};  // members of {ns}:seqcfg:ids
  std::string error;          // set when unreachable
};

// Connects, sends PING and counts the sequence configs stored under
// key_namespace. Read-only. Redis++ exceptions are reported in the status.
[[nodiscard]] CounterBackendStatus probe_counter_backend(const RedisConfig& config,
                                                         const std::string& key_namespace);

}  // namespace mseq::counter
