#include "mseq/counter/redis_health.h"

#include <sw/redis++/redis++.h>

namespace mseq::counter {

CounterBackendStatus probe_counter_backend(const RedisConfig& config,
                                           const std::string& key_namespace) {
  sw::redis::ConnectionOptions options;
  options.host = config.host;
  options.port = config.port;
  options.db = config.db_index;

  CounterBackendStatus status;
  try {
    sw::redis::Redis redis(options);
    redis.ping();
    status.reachable = true;
    status.config_count = redis.scard(key_namespace + ":seqcfg:ids");
  } catch (const sw::redis::Error& e) {
    status.error = e.what();
  }
  return status;
}

}  // namespace mseq::counter
