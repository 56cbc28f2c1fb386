#pragma once

#include "build_unit.h"
#include "compiler.h"
#include "version.h"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace knapsac {

struct package_entry {
  std::filesystem::path source;  // relative to the package root
  package_module module;

  bool operator==(package_entry const &) const = default;
};

using package_module_map = std::map<std::string, package_entry, std::less<>>;

// Sidecar written to <root>/manifest.json. Everything a clone needs to re-register the
// package; the root is wherever the clone lands.
struct package_manifest {
  std::string identifier;
  version_t version;
  language_cfg language;
  std::optional<std::string> remote_location;
  package_module_map modules;

  bool operator==(package_manifest const &) const = default;
};

struct package {
  std::string identifier;
  std::filesystem::path root;
  version_t version{ not_versioned{} };
  language_cfg language;
  std::optional<std::string> remote_location;  // set once registered with a remote
  package_module_map modules;

  static package from_manifest(package_manifest manifest, std::filesystem::path root);

  // Compiles every module in identifier order; the first failing module throws
  // registry_error(build_failed).
  void build(compiler &c) const;

  // Throws module_already_in_registry on a duplicate identifier and
  // location_not_relative if `relative_source` is absolute.
  void add_module(std::filesystem::path relative_source, package_module module);

  package_module const *get_module(std::string_view identifier) const;
  package_module *get_module_mut(std::string_view identifier);
  std::vector<package_entry const *> search_modules(std::string_view identifier) const;

  void increment_version(version_increment kind);

  // Throws location_not_under_root if `path` is not under `package_root`.
  bool has_module_source(std::filesystem::path const &package_root,
                         std::filesystem::path const &path) const;

  package_manifest manifest() const;

  bool operator==(package const &) const = default;
};

}  // namespace knapsac
