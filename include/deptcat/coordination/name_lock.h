#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace deptcat::coordination {

// INameLock serializes writers that target the same department name.
//
// The service's uniqueness check and its insert/update are separate gateway calls. Holding the
// lock on the case-folded name across both closes the check-then-act window for every writer
// that shares the same lock backend.
//
// Keys are opaque; the service passes "department:name:<folded name>".
// owner identifies the holder so release() never frees a lock taken by someone else.
class INameLock {
 public:
  virtual ~INameLock() = default;

  // Returns true if the lock was taken, false if another owner holds it.
  // Throws std::runtime_error when the backend is unreachable.
  [[nodiscard]] virtual bool try_acquire(const std::string& key, const std::string& owner) = 0;

  // Releases the lock if owner still holds it. Never throws.
  virtual void release(const std::string& key, const std::string& owner) noexcept = 0;

 protected:
  INameLock() = default;
  INameLock(const INameLock&) = default;
  INameLock& operator=(const INameLock&) = default;
  INameLock(INameLock&&) = default;
  INameLock& operator=(INameLock&&) = default;
};

// Default time-to-live for distributed locks: a crashed holder can not block a name forever.
constexpr std::chrono::milliseconds kDefaultLockTtl{10000};

// NameLockGuard releases an acquired lock when it goes out of scope.
class NameLockGuard {
 public:
  NameLockGuard(INameLock& lock, std::string key, std::string owner)
      : lock_(lock), key_(std::move(key)), owner_(std::move(owner)) {}
  ~NameLockGuard() { lock_.release(key_, owner_); }

  NameLockGuard(const NameLockGuard&) = delete;
  NameLockGuard& operator=(const NameLockGuard&) = delete;
  NameLockGuard(NameLockGuard&&) = delete;
  NameLockGuard& operator=(NameLockGuard&&) = delete;

 private:
  INameLock& lock_;
  std::string key_;
  std::string owner_;
};

}  // namespace deptcat::coordination
