#pragma once

#include "dependency.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace knapsac {

// Named outgoing edges of a build unit. No cross-unit validation happens here; the
// registry owns referential integrity and acyclicity.
class dependency_holder {
 public:
  // Inserts or overwrites.
  void add_dependency(std::string identifier, dependency dep);
  std::optional<dependency> get_dependency(std::string_view identifier) const;
  bool has_dependency(std::string_view identifier) const;

  // Removes the edge only if the stored value equals `dep`.
  bool remove_dependency(std::string_view identifier, dependency const &dep);

  // Removes every edge whose value satisfies `pred`; returns the removed edges.
  dependency_map remove_dependencies_if(std::function<bool(dependency const &)> const &pred);

  dependency_map const &dependencies() const { return dependencies_; }
  dependency_map &dependencies() { return dependencies_; }

  bool operator==(dependency_holder const &) const = default;

 private:
  dependency_map dependencies_;
};

struct standalone_module : dependency_holder {
  std::string identifier;
  std::filesystem::path source;
  std::filesystem::path output_location;  // absolute

  standalone_module() = default;
  standalone_module(std::string identifier,
                    std::filesystem::path source,
                    std::filesystem::path output_location);

  // Validates that `output_location` is an absolute path to an existing directory.
  static standalone_module create(std::string identifier,
                                  std::filesystem::path source,
                                  std::filesystem::path output_location);

  // True if every edge is a package or stray reference.
  bool has_only_package_module_dependencies() const;

  bool operator==(standalone_module const &) const = default;
};

// Anonymous; the registry keys executables by source path.
struct executable : dependency_holder {
  bool operator==(executable const &) const = default;
};

struct package_module : dependency_holder {
  std::string identifier;
  std::filesystem::path output_location;  // relative to the package root

  package_module() = default;
  package_module(std::string identifier, std::filesystem::path output_location);

  // Validates that `output_location` is relative.
  static package_module create(std::string identifier,
                               std::filesystem::path output_location);

  bool operator==(package_module const &) const = default;
};

// Module identifiers name output directories under a package root, so they must be a
// single non-empty path component other than "." or "..". Throws invalid_identifier.
void validate_identifier(std::string_view identifier);

// Owner of a dependency edge.
struct executable_ref {
  std::filesystem::path source;
  bool operator==(executable_ref const &) const = default;
};

struct module_ref {
  std::string identifier;
  bool operator==(module_ref const &) const = default;
};

struct package_module_ref {
  std::string package;
  std::string module;
  bool operator==(package_module_ref const &) const = default;
};

using unit_ref = std::variant<executable_ref, module_ref, package_module_ref>;

// executable:<path>, module:<id>, package:<pkg>/<mod>
std::string unit_ref_to_string(unit_ref const &ref);
unit_ref unit_ref_parse(std::string_view text);

}  // namespace knapsac
