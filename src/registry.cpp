#include "registry.h"

#include "registry_error.h"
#include "trace.h"
#include "tui.h"

#include <vector>

namespace knapsac {

namespace {

std::filesystem::path normalized(std::filesystem::path const &p) {
  return p.lexically_normal();
}

bool same_path(std::filesystem::path const &a, std::filesystem::path const &b) {
  return normalized(a) == normalized(b);
}

}  // namespace

registry::registry(store &s) : store_{ s }, state_{ s.load() } {}

// Queries

standalone_module const *registry::get_module(std::string_view identifier) const {
  auto const it{ state_.modules.find(identifier) };
  return it == state_.modules.end() ? nullptr : &it->second;
}

standalone_module const *registry::get_module_by_source(
    std::filesystem::path const &source) const {
  for (auto const &[_, module] : state_.modules) {
    if (same_path(module.source, source)) { return &module; }
  }
  return nullptr;
}

executable const *registry::get_executable(std::filesystem::path const &source) const {
  auto const it{ state_.executables.find(normalized(source)) };
  return it == state_.executables.end() ? nullptr : &it->second;
}

package const *registry::get_package(std::string_view identifier) const {
  auto const it{ state_.packages.find(identifier) };
  return it == state_.packages.end() ? nullptr : &it->second;
}

package_module const *registry::get_package_module(std::string_view package_id,
                                                   std::string_view module_id) const {
  auto const *pkg{ get_package(package_id) };
  return pkg ? pkg->get_module(module_id) : nullptr;
}

bool registry::has_module(std::string_view identifier) const {
  return get_module(identifier) != nullptr;
}

bool registry::has_executable(std::filesystem::path const &source) const {
  return get_executable(source) != nullptr;
}

bool registry::has_package(std::string_view identifier) const {
  return get_package(identifier) != nullptr;
}

std::vector<std::pair<std::string, package_entry const *>> registry::search_package_modules(
    std::string_view module_id) const {
  std::vector<std::pair<std::string, package_entry const *>> result;
  for (auto const &[package_id, pkg] : state_.packages) {
    for (auto const *entry : pkg.search_modules(module_id)) {
      result.emplace_back(package_id, entry);
    }
  }
  return result;
}

std::vector<standalone_module const *> registry::search_modules_by_source_prefix(
    std::filesystem::path const &root) const {
  std::vector<standalone_module const *> result;
  for (auto const &[_, module] : state_.modules) {
    auto const relative{ util_strip_prefix(root, module.source) };
    if (relative && !relative->empty()) { result.push_back(&module); }
  }
  return result;
}

bool registry::dependency_exists(dependency const &dep) const {
  return std::visit(match{
                        [](stray_dependency const &) { return true; },
                        [this](standalone_dependency const &d) {
                          return get_module_by_source(d.source) != nullptr;
                        },
                        [this](package_dependency const &d) {
                          return get_package_module(d.package, d.module) != nullptr;
                        },
                    },
                    dep);
}

std::string registry::dependency_key(dependency const &dep) const {
  return std::visit(match{
                        [](stray_dependency const &d) { return d.identifier; },
                        [this](standalone_dependency const &d) {
                          auto const *module{ get_module_by_source(d.source) };
                          if (!module) {
                            throw registry_error{ registry_errc::referenced_unit_missing,
                                                  "no module with source " +
                                                      d.source.string() };
                          }
                          return module->identifier;
                        },
                        [](package_dependency const &d) { return d.module; },
                    },
                    dep);
}

// Graph helpers

dependency_holder *registry::find_holder(unit_ref const &unit) {
  if (auto const *r{ std::get_if<package_module_ref>(&unit) }) {
    auto const it{ state_.packages.find(r->package) };
    return it == state_.packages.end() ? nullptr : it->second.get_module_mut(r->module);
  }
  return const_cast<dependency_holder *>(std::as_const(*this).find_holder(unit));
}

dependency_holder const *registry::find_holder(unit_ref const &unit) const {
  return std::visit(match{
                        [this](executable_ref const &r) -> dependency_holder const * {
                          return get_executable(r.source);
                        },
                        [this](module_ref const &r) -> dependency_holder const * {
                          return get_module(r.identifier);
                        },
                        [this](package_module_ref const &r) -> dependency_holder const * {
                          return get_package_module(r.package, r.module);
                        },
                    },
                    unit);
}

std::optional<unit_ref> registry::resolve(dependency const &dep) const {
  return std::visit(match{
                        [](stray_dependency const &) -> std::optional<unit_ref> {
                          return std::nullopt;
                        },
                        [this](standalone_dependency const &d) -> std::optional<unit_ref> {
                          auto const *module{ get_module_by_source(d.source) };
                          if (!module) { return std::nullopt; }
                          return module_ref{ module->identifier };
                        },
                        [](package_dependency const &d) -> std::optional<unit_ref> {
                          return package_module_ref{ d.package, d.module };
                        },
                    },
                    dep);
}

package const *registry::package_owning_source(std::filesystem::path const &source) const {
  for (auto const &[_, pkg] : state_.packages) {
    if (!util_strip_prefix(pkg.root, source)) { continue; }
    if (pkg.has_module_source(pkg.root, normalized(source))) { return &pkg; }
  }
  return nullptr;
}

// Iterative depth-first walk over resolved edges; nodes are keyed by unit_ref_to_string.
bool registry::reaches(unit_ref const &from,
                       unit_ref const &goal,
                       package const *pending) const {
  std::vector<unit_ref> stack{ from };
  std::set<std::string> visited;

  while (!stack.empty()) {
    unit_ref const node{ std::move(stack.back()) };
    stack.pop_back();

    if (node == goal) { return true; }
    if (!visited.insert(unit_ref_to_string(node)).second) { continue; }

    auto const *pm{ std::get_if<package_module_ref>(&node) };
    auto const *holder{ pending && pm && pm->package == pending->identifier
                            ? static_cast<dependency_holder const *>(
                                  pending->get_module(pm->module))
                            : find_holder(node) };
    if (!holder) { continue; }

    for (auto const &[_, dep] : holder->dependencies()) {
      if (auto next{ resolve(dep) }) { stack.push_back(std::move(*next)); }
    }
  }
  return false;
}

void registry::validate_edge(unit_ref const &owner,
                             std::string const &dependency_id,
                             dependency const &dep,
                             package const *pending) const {
  std::string const owner_name{ unit_ref_to_string(owner) };

  if (std::holds_alternative<package_module_ref>(owner) &&
      !dependency_is_package_reference(dep) &&
      !std::holds_alternative<stray_dependency>(dep)) {
    throw registry_error{ registry_errc::non_package_dependency,
                          owner_name + " may only depend on package modules, not " +
                              dependency_to_string(dep) };
  }

  auto const *pd{ std::get_if<package_dependency>(&dep) };
  bool const exists{ pending && pd && pd->package == pending->identifier
                         ? pending->get_module(pd->module) != nullptr
                         : dependency_exists(dep) };
  if (!exists) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          dependency_to_string(dep) };
  }

  auto const target{ resolve(dep) };
  if (!target) { return; }  // stray

  std::string const target_id{ dependency_key(dep) };
  if (target_id != dependency_id) {
    throw registry_error{ registry_errc::dependency_key_mismatch,
                          "edge '" + dependency_id + "' points at module '" + target_id +
                              "'" };
  }

  if (reaches(*target, owner, pending)) {
    KNAPSAC_TRACE_EMIT((trace_events::cycle_rejected{
        .owner = owner_name, .target = unit_ref_to_string(*target) }));
    throw registry_error{ registry_errc::cyclic_dependency,
                          owner_name + " -> " + unit_ref_to_string(*target) };
  }
}

std::size_t registry::cascade_remove(std::string const &removed,
                                     std::function<bool(dependency const &)> const &pred) {
  std::size_t count{ 0 };

  auto const sweep{ [&](dependency_holder &holder, unit_ref const &owner) {
    auto const dropped{ holder.remove_dependencies_if(pred) };
    for (auto const &[id, dep] : dropped) {
      KNAPSAC_TRACE_EMIT((trace_events::dependency_removed{
          .owner = unit_ref_to_string(owner),
          .identifier = id,
          .dependency = dependency_to_string(dep),
          .cascade = true }));
      tui::debug("dropped edge %s -> %s (%s removed)",
                 unit_ref_to_string(owner).c_str(),
                 id.c_str(),
                 removed.c_str());
    }
    count += dropped.size();
    return !dropped.empty();
  } };

  for (auto &[id, module] : state_.modules) { sweep(module, module_ref{ id }); }
  for (auto &[source, exe] : state_.executables) { sweep(exe, executable_ref{ source }); }
  for (auto &[package_id, pkg] : state_.packages) {
    for (auto &[module_id, entry] : pkg.modules) {
      if (sweep(entry.module, package_module_ref{ package_id, module_id })) {
        mark_manifest_dirty(package_id);
      }
    }
  }

  return count;
}

package &registry::require_package(std::string_view package_id) {
  auto const it{ state_.packages.find(package_id) };
  if (it == state_.packages.end()) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          "package " + std::string{ package_id } };
  }
  return it->second;
}

void registry::mark_manifest_dirty(std::string const &package_id) {
  dirty_manifests_.insert(package_id);
}

void registry::save() {
  store_.save(state_);

  auto const dirty{ std::exchange(dirty_manifests_, {}) };
  for (auto const &package_id : dirty) {
    if (auto const *pkg{ get_package(package_id) }) {
      store_.save_manifest(pkg->root, pkg->manifest());
    }
  }
}

// Mutators

void registry::add_module(standalone_module module) {
  validate_identifier(module.identifier);
  if (has_module(module.identifier)) {
    throw registry_error{ registry_errc::module_already_in_registry, module.identifier };
  }
  if (auto const *existing{ get_module_by_source(module.source) }) {
    throw registry_error{ registry_errc::module_already_in_registry,
                          module.source.string() + " is already module '" +
                              existing->identifier + "'" };
  }
  if (auto const *owner_pkg{ package_owning_source(module.source) }) {
    throw registry_error{ registry_errc::module_already_in_registry,
                          module.source.string() + " already belongs to package '" +
                              owner_pkg->identifier + "'" };
  }

  unit_ref const owner{ module_ref{ module.identifier } };
  for (auto const &[id, dep] : module.dependencies()) { validate_edge(owner, id, dep); }

  tui::info("added module %s (%s)",
            module.identifier.c_str(),
            module.source.string().c_str());
  KNAPSAC_TRACE_EMIT((trace_events::unit_added{ .unit = unit_ref_to_string(owner) }));

  std::string key{ module.identifier };
  state_.modules.emplace(std::move(key), std::move(module));
  save();
}

void registry::add_executable(std::filesystem::path source) {
  source = normalized(source);
  if (state_.executables.contains(source)) {
    tui::debug("executable %s already registered", source.string().c_str());
    return;
  }

  tui::info("added executable %s", source.string().c_str());
  KNAPSAC_TRACE_EMIT(
      (trace_events::unit_added{ .unit = unit_ref_to_string(executable_ref{ source }) }));

  state_.executables.emplace(std::move(source), executable{});
  save();
}

void registry::add_dependency(unit_ref const &owner,
                              std::string dependency_id,
                              dependency dep) {
  auto *holder{ find_holder(owner) };
  if (!holder) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          unit_ref_to_string(owner) };
  }

  validate_edge(owner, dependency_id, dep);

  if (auto const existing{ holder->get_dependency(dependency_id) }; existing == dep) {
    tui::debug("%s already depends on %s",
               unit_ref_to_string(owner).c_str(),
               dependency_to_string(dep).c_str());
    return;
  }

  KNAPSAC_TRACE_EMIT((trace_events::dependency_added{
      .owner = unit_ref_to_string(owner),
      .identifier = dependency_id,
      .dependency = dependency_to_string(dep) }));
  tui::info("%s -> %s",
            unit_ref_to_string(owner).c_str(),
            dependency_to_string(dep).c_str());

  holder->add_dependency(std::move(dependency_id), std::move(dep));
  if (auto const *pm{ std::get_if<package_module_ref>(&owner) }) {
    mark_manifest_dirty(pm->package);
  }
  save();
}

void registry::remove_dependency(unit_ref const &owner,
                                 std::string_view dependency_id,
                                 dependency const &dep) {
  auto *holder{ find_holder(owner) };
  if (!holder) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          unit_ref_to_string(owner) };
  }

  if (!holder->remove_dependency(dependency_id, dep)) {
    throw registry_error{ registry_errc::no_such_dependency,
                          unit_ref_to_string(owner) + " has no edge '" +
                              std::string{ dependency_id } + "' = " +
                              dependency_to_string(dep) };
  }

  KNAPSAC_TRACE_EMIT((trace_events::dependency_removed{
      .owner = unit_ref_to_string(owner),
      .identifier = std::string{ dependency_id },
      .dependency = dependency_to_string(dep),
      .cascade = false }));

  if (auto const *pm{ std::get_if<package_module_ref>(&owner) }) {
    mark_manifest_dirty(pm->package);
  }
  save();
}

void registry::remove_item(unit_ref const &unit) {
  std::visit(match{
                 [this](executable_ref const &r) { remove_executable(r.source); },
                 [this](module_ref const &r) { remove_module(r.identifier); },
                 [this](package_module_ref const &r) {
                   remove_package_module(r.package, r.module);
                 },
             },
             unit);
}

void registry::remove_module(std::string_view identifier) {
  auto const it{ state_.modules.find(identifier) };
  if (it == state_.modules.end()) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          "module " + std::string{ identifier } };
  }

  std::string const id{ it->first };
  std::filesystem::path const source{ it->second.source };
  state_.modules.erase(it);

  std::string const name{ unit_ref_to_string(module_ref{ id }) };
  auto const cascaded{ cascade_remove(name, [&](dependency const &dep) {
    if (auto const *d{ std::get_if<standalone_dependency>(&dep) }) {
      return same_path(d->source, source);
    }
    if (auto const *d{ std::get_if<stray_dependency>(&dep) }) {
      return d->identifier == id;
    }
    return false;
  }) };

  tui::info("removed module %s (%zu dependent edges dropped)", id.c_str(), cascaded);
  KNAPSAC_TRACE_EMIT(
      (trace_events::unit_removed{ .unit = name, .cascaded_edges = cascaded }));
  save();
}

void registry::remove_executable(std::filesystem::path const &source) {
  auto const it{ state_.executables.find(normalized(source)) };
  if (it == state_.executables.end()) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          "executable " + source.string() };
  }

  std::string const name{ unit_ref_to_string(executable_ref{ it->first }) };
  state_.executables.erase(it);

  tui::info("removed executable %s", source.string().c_str());
  KNAPSAC_TRACE_EMIT((trace_events::unit_removed{ .unit = name, .cascaded_edges = 0 }));
  save();
}

void registry::remove_package_module(std::string_view package_id,
                                     std::string_view module_id) {
  auto &pkg{ require_package(package_id) };
  auto const it{ pkg.modules.find(module_id) };
  if (it == pkg.modules.end()) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          "package module " + std::string{ package_id } + "/" +
                              std::string{ module_id } };
  }

  package_dependency const removed{ pkg.identifier, it->first };
  pkg.modules.erase(it);
  mark_manifest_dirty(removed.package);

  std::string const name{ unit_ref_to_string(
      package_module_ref{ removed.package, removed.module }) };
  auto const cascaded{ cascade_remove(name, [&](dependency const &dep) {
    auto const *d{ std::get_if<package_dependency>(&dep) };
    return d && *d == removed;
  }) };

  tui::info("removed %s (%zu dependent edges dropped)", name.c_str(), cascaded);
  KNAPSAC_TRACE_EMIT(
      (trace_events::unit_removed{ .unit = name, .cascaded_edges = cascaded }));
  save();
}

void registry::remove_package(std::string_view package_id) {
  auto const it{ state_.packages.find(package_id) };
  if (it == state_.packages.end()) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          "package " + std::string{ package_id } };
  }

  std::string const id{ it->first };
  state_.packages.erase(it);
  dirty_manifests_.erase(id);

  std::string const name{ "package:" + id };
  auto const cascaded{ cascade_remove(name, [&](dependency const &dep) {
    auto const *d{ std::get_if<package_dependency>(&dep) };
    return d && d->package == id;
  }) };

  tui::info("removed package %s (%zu dependent edges dropped)", id.c_str(), cascaded);
  KNAPSAC_TRACE_EMIT(
      (trace_events::unit_removed{ .unit = name, .cascaded_edges = cascaded }));
  save();
}

void registry::mark_as_module(std::filesystem::path const &source,
                              std::string identifier,
                              std::filesystem::path output_location) {
  auto const exe_it{ state_.executables.find(normalized(source)) };
  if (exe_it == state_.executables.end()) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          "executable " + source.string() };
  }
  if (has_module(identifier)) {
    throw registry_error{ registry_errc::module_already_in_registry, identifier };
  }
  if (auto const *existing{ get_module_by_source(source) }) {
    throw registry_error{ registry_errc::module_already_in_registry,
                          source.string() + " is already module '" +
                              existing->identifier + "'" };
  }
  if (auto const *owner_pkg{ package_owning_source(source) }) {
    throw registry_error{ registry_errc::module_already_in_registry,
                          source.string() + " already belongs to package '" +
                              owner_pkg->identifier + "'" };
  }

  auto module{
    standalone_module::create(identifier, exe_it->first, std::move(output_location))
  };
  module.dependencies() = exe_it->second.dependencies();

  state_.executables.erase(exe_it);

  tui::info("marked %s as module %s", source.string().c_str(), identifier.c_str());
  KNAPSAC_TRACE_EMIT(
      (trace_events::unit_added{ .unit = unit_ref_to_string(module_ref{ identifier }) }));

  state_.modules.emplace(std::move(identifier), std::move(module));
  save();
}

void registry::build_package(std::string_view package_id, compiler &c) const {
  auto const *pkg{ get_package(package_id) };
  if (!pkg) {
    throw registry_error{ registry_errc::referenced_unit_missing,
                          "package " + std::string{ package_id } };
  }
  pkg->build(c);
}

}  // namespace knapsac
