#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace knapsac {

// Untracked reference to something outside the registry; never validated.
struct stray_dependency {
  std::string identifier;
  std::filesystem::path output_location;

  bool operator==(stray_dependency const &) const = default;
};

// Registered standalone module, resolved by its source path.
struct standalone_dependency {
  std::filesystem::path source;

  bool operator==(standalone_dependency const &) const = default;
};

// Module owned by a package.
struct package_dependency {
  std::string package;
  std::string module;

  bool operator==(package_dependency const &) const = default;
};

using dependency = std::variant<stray_dependency, standalone_dependency, package_dependency>;

// Keyed by the identifier of the unit depended upon.
using dependency_map = std::map<std::string, dependency, std::less<>>;

bool dependency_is_package_reference(dependency const &dep);

// CLI/log form: stray:<id>=<path>, module:<source>, package:<pkg>/<mod>
std::string dependency_to_string(dependency const &dep);

// Inverse of dependency_to_string. Throws std::runtime_error on malformed input.
dependency dependency_parse(std::string_view text);

}  // namespace knapsac
