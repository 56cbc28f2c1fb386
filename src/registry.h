#pragma once

#include "build_unit.h"
#include "compiler.h"
#include "package.h"
#include "store.h"
#include "util.h"
#include "vcs.h"
#include "version.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace knapsac {

// The dependency graph of every known build unit. Each mutator validates, then mutates,
// then writes the whole graph through the store; a validation failure leaves both the
// in-memory graph and the persisted document untouched.
//
// Invariants after every successful mutation:
//  - identifiers are unique per namespace (modules, packages, modules of one package)
//  - every standalone/package edge resolves to a registered unit
//  - module edges form no cycle
//  - package modules carry only package or stray edges
class registry : unmovable {
 public:
  explicit registry(store &s);

  void add_module(standalone_module module);

  // Re-adding a known source path is a no-op.
  void add_executable(std::filesystem::path source);

  // Inserts `dependency_id -> dep` on `owner`. Adding an identical edge again is a no-op.
  void add_dependency(unit_ref const &owner, std::string dependency_id, dependency dep);

  // Removes the edge only if it currently equals `dep`.
  void remove_dependency(unit_ref const &owner,
                         std::string_view dependency_id,
                         dependency const &dep);

  // Removes the unit and every edge elsewhere that pointed at it.
  void remove_item(unit_ref const &unit);
  void remove_module(std::string_view identifier);
  void remove_executable(std::filesystem::path const &source);
  void remove_package_module(std::string_view package_id, std::string_view module_id);
  void remove_package(std::string_view package_id);

  // Turns a registered executable into a standalone module, keeping its edges.
  void mark_as_module(std::filesystem::path const &source,
                      std::string identifier,
                      std::filesystem::path output_location);

  // Moves every standalone module whose source lies under `root` into a new package
  // and rewrites edges that pointed at them. With `build_with`, the new package is built
  // once it is saved; a build failure leaves the promotion in place.
  void promote_to_package(std::string package_id,
                          std::filesystem::path const &root,
                          language_cfg language,
                          vcs &v,
                          compiler *build_with = nullptr);

  // Bumps the version, then commits and tags it.
  void publish(std::string_view package_id, version_increment kind, vcs &v);

  // Records the remote (first upload only), commits the manifest and pushes the current
  // branch to origin.
  void upload(std::string_view package_id,
              std::optional<std::string> const &remote_url,
              vcs &v);

  // Clones `url` into `destination/<repository name>` and registers the package its
  // manifest describes. Returns the package identifier.
  std::string download(std::string const &url,
                       std::filesystem::path const &destination,
                       vcs &v);

  void build_package(std::string_view package_id, compiler &c) const;

  standalone_module const *get_module(std::string_view identifier) const;
  standalone_module const *get_module_by_source(std::filesystem::path const &source) const;
  executable const *get_executable(std::filesystem::path const &source) const;
  package const *get_package(std::string_view identifier) const;
  package_module const *get_package_module(std::string_view package_id,
                                           std::string_view module_id) const;

  bool has_module(std::string_view identifier) const;
  bool has_executable(std::filesystem::path const &source) const;
  bool has_package(std::string_view identifier) const;

  // Every package module named `module_id`, paired with its package identifier.
  std::vector<std::pair<std::string, package_entry const *>> search_package_modules(
      std::string_view module_id) const;

  std::vector<standalone_module const *> search_modules_by_source_prefix(
      std::filesystem::path const &root) const;

  // True if `dep` resolves to a registered unit. Stray edges always exist.
  bool dependency_exists(dependency const &dep) const;

  // The key an edge to `dep` must be stored under. Throws referenced_unit_missing for an
  // unresolvable standalone edge.
  std::string dependency_key(dependency const &dep) const;

  registry_snapshot const &snapshot() const { return state_; }

 private:
  dependency_holder *find_holder(unit_ref const &unit);
  dependency_holder const *find_holder(unit_ref const &unit) const;

  std::optional<unit_ref> resolve(dependency const &dep) const;
  // `pending` is a package about to be inserted; its modules are visible to the walk and
  // to edge validation as though it were already registered.
  bool reaches(unit_ref const &from,
               unit_ref const &goal,
               package const *pending = nullptr) const;
  void validate_edge(unit_ref const &owner,
                     std::string const &dependency_id,
                     dependency const &dep,
                     package const *pending = nullptr) const;

  // Package whose module table already lists `source`, if any.
  package const *package_owning_source(std::filesystem::path const &source) const;

  // Drops matching edges from every remaining unit; returns how many were dropped.
  std::size_t cascade_remove(std::string const &removed,
                             std::function<bool(dependency const &)> const &pred);

  package &require_package(std::string_view package_id);
  void mark_manifest_dirty(std::string const &package_id);
  void save();

  store &store_;
  registry_snapshot state_;
  std::set<std::string, std::less<>> dirty_manifests_;
};

}  // namespace knapsac
