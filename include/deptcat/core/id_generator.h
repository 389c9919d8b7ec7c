#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace deptcat::core {

// Prefixes of the two identifier families. A trace id names one service call and is the key
// audit/trace looks events up by; an event id names one audit row within that trace.
inline constexpr std::string_view kTraceIdPrefix = "trace";
inline constexpr std::string_view kEventIdPrefix = "evt";

// IIdGenerator produces trace and audit event identifiers.
// Department ids are never generated here; they are assigned by the storage layer.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is non-empty and starts with prefix.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<unix micros>-<counter>": unique within the process, sortable by creation time.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// "<prefix>-<counter>": the same call sequence yields the same IDs.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace deptcat::core
