#include "deptcat/core/id_generator.h"

#include <chrono>

namespace deptcat::core {

namespace {

std::string join_id(const std::string_view prefix, const std::string& stem) {
  std::string id;
  id.reserve(prefix.size() + 1 + stem.size());
  id.append(prefix);
  id.push_back('-');
  id.append(stem);
  return id;
}

}  // namespace

// Audit rows written by separate server processes against one database stay distinct
// because the stem leads with wall-clock microseconds.
std::string SystemIdGenerator::next(const std::string_view prefix) {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count();
  const auto sequence = counter_.fetch_add(1, std::memory_order_relaxed);
  return join_id(prefix, std::to_string(micros) + "-" + std::to_string(sequence));
}

// Tests pin trace ids with this, e.g. the first add of a fresh service runs under "trace-0".
std::string DeterministicIdGenerator::next(const std::string_view prefix) {
  return join_id(prefix, std::to_string(counter_.fetch_add(1, std::memory_order_relaxed)));
}

}  // namespace deptcat::core
