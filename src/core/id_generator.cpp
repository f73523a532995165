#include "mseq/core/id_generator.h"

#include <chrono>

namespace mseq::core {

namespace {

std::string join_id(std::string_view prefix, const std::string& suffix) {
  std::string id;
  id.reserve(prefix.size() + 1 + suffix.size());
  id.append(prefix);
  id.push_back('-');
  id.append(suffix);
  return id;
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count();
  const auto serial = counter_.fetch_add(1, std::memory_order_relaxed);
  return join_id(prefix, std::to_string(micros) + "-" + std::to_string(serial));
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  return join_id(prefix, std::to_string(counter_.fetch_add(1, std::memory_order_relaxed)));
}

}  // namespace mseq::core
