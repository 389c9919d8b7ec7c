#pragma once

#include <string>
#include <utility>

namespace deptcat::core {

// IClock supplies the created_at stamp of audit events so tests can pin them.
// Second precision only; events within one trace are ordered by append order, not time.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current time as ISO 8601 UTC, e.g. "2026-01-01T00:00:00Z".
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// FixedClock always reports the timestamp it was built with, so audit payload assertions can
// compare created_at exactly.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

}  // namespace deptcat::core
