#include "store.h"

#include "registry_error.h"
#include "registry_json.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace knapsac {

namespace {

void validate_registry_path(std::filesystem::path const &path) {
  if (!path.is_absolute()) {
    throw registry_error{ registry_errc::registry_path_not_absolute, path.string() };
  }

  std::error_code ec;
  if (std::filesystem::is_directory(path, ec) || !path.has_extension()) {
    throw registry_error{ registry_errc::registry_path_not_file, path.string() };
  }
  if (path.extension() != ".json") {
    throw registry_error{ registry_errc::registry_path_not_json, path.string() };
  }
}

// Writes `<path>.tmp` next to the target and renames it into place.
void write_atomically(std::filesystem::path const &path, std::string_view content) {
  std::filesystem::path tmp{ path };
  tmp += ".tmp";
  scoped_path_cleanup cleanup{ tmp };

  util_write_file(tmp, content);
  platform::atomic_rename(tmp, path);
}

std::size_t count_package_modules(registry_snapshot const &snapshot) {
  std::size_t count{ 0 };
  for (auto const &[_, pkg] : snapshot.packages) { count += pkg.modules.size(); }
  return count;
}

}  // namespace

file_store::file_store(std::filesystem::path path) : path_{ std::move(path) } {}

registry_snapshot file_store::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    tui::debug("registry %s does not exist, starting empty", path_.string().c_str());
    return {};
  }

  std::string content;
  try {
    content = util_load_file(path_);
  } catch (std::runtime_error const &e) {
    throw registry_error{ registry_errc::invalid_registry, e.what() };
  }

  auto snapshot{ registry_from_json(content) };
  tui::debug("loaded registry %s: %zu modules, %zu executables, %zu packages",
             path_.string().c_str(),
             snapshot.modules.size(),
             snapshot.executables.size(),
             snapshot.packages.size());
  return snapshot;
}

void file_store::save(registry_snapshot const &snapshot) {
  validate_registry_path(path_);

  if (auto const parent{ path_.parent_path() }; !parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  write_atomically(path_, registry_to_json(snapshot));

  KNAPSAC_TRACE_EMIT((trace_events::registry_saved{
      .location = path_.string(),
      .modules = snapshot.modules.size(),
      .executables = snapshot.executables.size(),
      .packages = snapshot.packages.size() }));
  tui::debug("saved registry %s (%zu package modules)",
             path_.string().c_str(),
             count_package_modules(snapshot));
}

void file_store::save_manifest(std::filesystem::path const &package_root,
                               package_manifest const &manifest) {
  write_atomically(package_root / kManifestFileName, manifest_to_json(manifest));
}

std::optional<package_manifest> file_store::load_manifest(
    std::filesystem::path const &package_root) {
  auto const manifest_path{ package_root / kManifestFileName };
  std::error_code ec;
  if (!std::filesystem::is_regular_file(manifest_path, ec)) { return std::nullopt; }

  try {
    return manifest_from_json(util_load_file(manifest_path));
  } catch (registry_error const &) {
    throw;
  } catch (std::runtime_error const &e) {
    throw registry_error{ registry_errc::invalid_registry, e.what() };
  }
}

platform::file_lock file_store::lock() const {
  std::filesystem::path lock_path{ path_ };
  lock_path += ".lock";
  if (auto const parent{ lock_path.parent_path() }; !parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  return platform::file_lock{ lock_path };
}

registry_snapshot memory_store::load() {
  if (document_.empty()) { return {}; }
  return registry_from_json(document_);
}

void memory_store::save(registry_snapshot const &snapshot) {
  document_ = registry_to_json(snapshot);
  ++save_count_;
  KNAPSAC_TRACE_EMIT((trace_events::registry_saved{
      .location = describe(),
      .modules = snapshot.modules.size(),
      .executables = snapshot.executables.size(),
      .packages = snapshot.packages.size() }));
}

void memory_store::save_manifest(std::filesystem::path const &package_root,
                                 package_manifest const &manifest) {
  manifests_[package_root] = manifest_to_json(manifest);
  ++manifest_save_count_;
}

std::optional<package_manifest> memory_store::load_manifest(
    std::filesystem::path const &package_root) {
  auto const it{ manifests_.find(package_root) };
  if (it == manifests_.end()) { return std::nullopt; }
  return manifest_from_json(it->second);
}

std::filesystem::path resolve_registry_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) { return *explicit_path; }

  if (char const *env{ std::getenv("KNAPSAC_REGISTRY") }; env && *env) {
    return std::filesystem::path{ env };
  }

  if (auto const home{ platform::get_home_dir() }) {
    return *home / "knapsac_registry.json";
  }

  throw std::runtime_error("cannot locate registry: pass --registry, or set "
                           "KNAPSAC_REGISTRY or HOME");
}

}  // namespace knapsac
