#include "registry.h"

#include "registry_error.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <map>
#include <system_error>

namespace knapsac {

namespace {

constexpr char kOriginRemote[]{ "origin" };

void require_directory(std::filesystem::path const &path) {
  if (!path.is_absolute()) {
    throw registry_error{ registry_errc::location_not_absolute, path.string() };
  }
  std::error_code ec;
  auto const status{ std::filesystem::status(path, ec) };
  if (ec || !std::filesystem::exists(status)) {
    throw registry_error{ registry_errc::location_does_not_exist, path.string() };
  }
  if (!std::filesystem::is_directory(status)) {
    throw registry_error{ registry_errc::location_not_directory, path.string() };
  }
}

void create_output_directory(std::filesystem::path const &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (!ec) { return; }

  bool const blocked{ ec == std::errc::not_a_directory || ec == std::errc::file_exists };
  throw registry_error{ blocked ? registry_errc::location_not_directory
                                : registry_errc::location_does_not_exist,
                        dir.string() + ": " + ec.message() };
}

// "https://host/user/widgets.git/" -> "widgets"
std::string repository_name(std::string_view url) {
  while (!url.empty() && (url.back() == '/' || url.back() == '\\')) { url.remove_suffix(1); }
  auto const slash{ url.find_last_of("/\\:") };
  if (slash != std::string_view::npos) { url.remove_prefix(slash + 1); }
  if (url.ends_with(".git")) { url.remove_suffix(4); }
  return std::string{ url };
}

}  // namespace

void registry::promote_to_package(std::string package_id,
                                  std::filesystem::path const &root_in,
                                  language_cfg language,
                                  vcs &v,
                                  compiler *build_with) {
  if (has_package(package_id)) {
    throw registry_error{ registry_errc::package_already_exists, package_id };
  }
  require_directory(root_in);
  auto const root{ root_in.lexically_normal() };

  // source -> (module identifier, source relative to root)
  std::map<std::filesystem::path, std::pair<std::string, std::filesystem::path>> converted;
  for (auto const *module : search_modules_by_source_prefix(root)) {
    auto relative{ *util_strip_prefix(root, module->source) };
    converted.emplace(module->source.lexically_normal(),
                      std::pair{ module->identifier, std::move(relative) });
  }

  // Edges between modules moving together are rewritten below; anything else that is not
  // a package or stray edge would break the package-module rule.
  for (auto const &[source, moved] : converted) {
    auto const &module{ state_.modules.at(moved.first) };
    if (module.has_only_package_module_dependencies()) { continue; }
    for (auto const &[id, dep] : module.dependencies()) {
      auto const *standalone{ std::get_if<standalone_dependency>(&dep) };
      if (!standalone || converted.contains(standalone->source.lexically_normal())) {
        continue;
      }
      throw registry_error{ registry_errc::non_package_dependency,
                            "module '" + module.identifier + "' depends on " +
                                dependency_to_string(dep) + " outside " + root.string() };
    }
  }

  auto const rewrite{ [&](dependency_holder &holder, unit_ref const &owner) {
    for (auto &[id, dep] : holder.dependencies()) {
      auto const *standalone{ std::get_if<standalone_dependency>(&dep) };
      if (!standalone) { continue; }

      auto const it{ converted.find(standalone->source.lexically_normal()) };
      if (it == converted.end()) { continue; }

      dependency rewritten{ package_dependency{ package_id, it->second.first } };
      KNAPSAC_TRACE_EMIT((trace_events::dependency_rewritten{
          .owner = unit_ref_to_string(owner),
          .identifier = id,
          .from = dependency_to_string(dep),
          .to = dependency_to_string(rewritten) }));
      dep = std::move(rewritten);
    }
  } };

  // The package is assembled from copies; the graph is only touched once every step that
  // can fail has passed.
  package pkg;
  pkg.identifier = package_id;
  pkg.root = root;
  pkg.language = std::move(language);

  for (auto const &[source, moved] : converted) {
    auto const &[module_id, relative_source] = moved;
    auto module{ package_module::create(module_id,
                                        std::filesystem::path{ module_id } / "output") };
    module.dependencies() = state_.modules.at(module_id).dependencies();
    pkg.add_module(relative_source, std::move(module));
  }
  for (auto &[module_id, entry] : pkg.modules) {
    rewrite(entry.module, package_module_ref{ package_id, module_id });
  }

  for (auto const &[_, entry] : pkg.modules) {
    create_output_directory(root / entry.module.output_location);
  }

  if (auto const enclosing{ v.discover(root) }; enclosing && enclosing->workdir != root) {
    tui::warn("%s lies inside repository %s; the package gets its own repository",
              root.string().c_str(),
              enclosing->workdir.string().c_str());
  }
  v.open_or_init(root);

  for (auto const &[source, moved] : converted) {
    state_.modules.erase(moved.first);
    tui::debug("moved module %s into package %s", moved.first.c_str(), package_id.c_str());
  }
  for (auto &[id, module] : state_.modules) { rewrite(module, module_ref{ id }); }
  for (auto &[source, exe] : state_.executables) { rewrite(exe, executable_ref{ source }); }

  tui::info("packaged %zu modules under %s as %s",
            pkg.modules.size(),
            root.string().c_str(),
            package_id.c_str());
  KNAPSAC_TRACE_EMIT((trace_events::package_promoted{ .package = package_id,
                                                      .root = root.string(),
                                                      .module_count = pkg.modules.size() }));

  auto const &inserted{ state_.packages.emplace(package_id, std::move(pkg)).first->second };
  mark_manifest_dirty(package_id);
  save();

  if (build_with) { inserted.build(*build_with); }
}

void registry::publish(std::string_view package_id, version_increment kind, vcs &v) {
  auto &pkg{ require_package(package_id) };

  pkg.increment_version(kind);
  std::string const version{ version_to_string(pkg.version) };
  mark_manifest_dirty(pkg.identifier);
  save();

  std::vector<std::filesystem::path> paths{ pkg.root / kManifestFileName };
  for (auto const &[_, entry] : pkg.modules) {
    paths.push_back(pkg.root / entry.source);
    paths.push_back(pkg.root / entry.module.output_location);
  }

  auto const repo{ v.open_or_init(pkg.root) };
  v.commit(repo, "updated to version: " + version, paths);
  v.tag(repo, version);

  tui::info("published %s %s", pkg.identifier.c_str(), version.c_str());
}

void registry::upload(std::string_view package_id,
                      std::optional<std::string> const &remote_url,
                      vcs &v) {
  auto &pkg{ require_package(package_id) };

  if (!pkg.remote_location) {
    if (!remote_url) {
      throw registry_error{ registry_errc::no_remote_location,
                            "package " + pkg.identifier + " has no remote; pass one" };
    }
    pkg.remote_location = *remote_url;
  } else if (remote_url && *remote_url != *pkg.remote_location) {
    tui::warn("package %s already uploads to %s; ignoring %s",
              pkg.identifier.c_str(),
              pkg.remote_location->c_str(),
              remote_url->c_str());
  }
  mark_manifest_dirty(pkg.identifier);
  save();

  auto const repo{ v.open_or_init(pkg.root) };
  v.commit(repo,
           "updated remote location: " + *pkg.remote_location,
           { pkg.root / kManifestFileName });

  auto const remotes{ v.remotes(repo) };
  if (std::find(remotes.begin(), remotes.end(), kOriginRemote) == remotes.end()) {
    v.add_remote(repo, kOriginRemote, *pkg.remote_location);
  }

  std::string const branch{ v.current_branch(repo) };
  v.push(repo, kOriginRemote, branch);

  tui::info("uploaded %s to %s", pkg.identifier.c_str(), pkg.remote_location->c_str());
}

std::string registry::download(std::string const &url,
                               std::filesystem::path const &destination,
                               vcs &v) {
  require_directory(destination);

  std::string const name{ repository_name(url) };
  if (name.empty()) {
    throw registry_error{ registry_errc::download_failed,
                          "cannot derive a directory name from " + url };
  }

  auto const root{ (destination / name).lexically_normal() };
  std::error_code ec;
  if (std::filesystem::exists(root, ec)) {
    throw registry_error{ registry_errc::download_failed,
                          root.string() + " already exists" };
  }

  // Removes the clone unless the package makes it into the graph.
  scoped_path_cleanup clone_cleanup{ root };

  std::optional<package_manifest> manifest;
  try {
    v.clone(url, root);
    manifest = store_.load_manifest(root);
  } catch (registry_error const &e) {
    throw registry_error{ registry_errc::download_failed, e.what() };
  }
  if (!manifest) {
    throw registry_error{ registry_errc::download_failed,
                          url + " has no " + kManifestFileName };
  }

  if (has_package(manifest->identifier)) {
    throw registry_error{ registry_errc::package_already_exists, manifest->identifier };
  }

  auto pkg{ package::from_manifest(std::move(*manifest), root) };
  if (!pkg.remote_location) { pkg.remote_location = url; }

  // Same edge rules as add_dependency, with the incoming package visible to the checks.
  for (auto const &[module_id, entry] : pkg.modules) {
    validate_identifier(module_id);
    auto const output{ (root / entry.module.output_location).lexically_normal() };
    if (entry.module.output_location.is_absolute() || !util_strip_prefix(root, output)) {
      throw registry_error{ registry_errc::location_not_under_root,
                            pkg.identifier + "/" + module_id + " writes to " +
                                entry.module.output_location.string() };
    }

    package_module_ref const owner{ pkg.identifier, module_id };
    for (auto const &[id, dep] : entry.module.dependencies()) {
      validate_edge(owner, id, dep, &pkg);
    }
  }

  for (auto const &[_, entry] : pkg.modules) {
    create_output_directory(root / entry.module.output_location);
  }

  std::string id{ pkg.identifier };
  tui::info("downloaded %s %s into %s",
            id.c_str(),
            version_to_string(pkg.version).c_str(),
            root.string().c_str());
  KNAPSAC_TRACE_EMIT((trace_events::unit_added{ .unit = "package:" + id }));

  state_.packages.emplace(id, std::move(pkg));
  clone_cleanup.release();
  save();
  return id;
}

}  // namespace knapsac
