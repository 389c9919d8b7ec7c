#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace deptcat::domain {

constexpr std::size_t kMaxNameLength = 100;
constexpr std::size_t kMaxDescriptionLength = 500;

// Department is the single managed record.
// - id: assigned by storage on creation, 0 before persistence, immutable afterwards
// - name: required, 1-100 characters, unique under case-insensitive comparison;
//   stored exactly as given (surrounding whitespace is significant)
// - description: optional, 0-500 characters, absent is stored as ""
struct Department {
  std::int64_t id{0};
  std::string name;
  std::string description;

  bool operator==(const Department&) const = default;
};

// Response shape: {"id", "name", "description"}.
[[nodiscard]] nlohmann::json department_to_json(const Department& department);

// Builds a Department from a create/update payload.
// Missing or null "name"/"description" map to "". "id" is read when present.
// Throws nlohmann::json::exception on type mismatches.
[[nodiscard]] Department department_from_json(const nlohmann::json& payload);

}  // namespace deptcat::domain
