#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace knapsac {

struct not_versioned {
  bool operator==(not_versioned const &) const = default;
};

struct semver_version {
  std::uint64_t major;
  std::uint64_t minor;
  std::uint64_t patch;

  bool operator==(semver_version const &) const = default;
};

using version_t = std::variant<not_versioned, semver_version>;

enum class version_increment { major, minor, patch };

// First increment from not_versioned yields 1.0.0, 0.1.0 or 0.0.1. Afterwards only the
// targeted component changes: 1.1.1 -> major -> 2.1.1.
version_t version_increment_apply(version_t const &current, version_increment kind);

// "not_versioned" or "M.m.p".
std::string version_to_string(version_t const &v);

// Inverse of version_to_string. Pre-release and build suffixes are rejected.
std::optional<version_t> version_parse(std::string_view text);

std::optional<version_increment> version_increment_parse(std::string_view text);

}  // namespace knapsac
