#include "package.h"

#include "registry_error.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <chrono>

namespace knapsac {

package package::from_manifest(package_manifest manifest, std::filesystem::path root) {
  package result;
  result.identifier = std::move(manifest.identifier);
  result.root = std::move(root);
  result.version = std::move(manifest.version);
  result.language = std::move(manifest.language);
  result.remote_location = std::move(manifest.remote_location);
  result.modules = std::move(manifest.modules);
  return result;
}

void package::build(compiler &c) const {
  for (auto const &[module_id, entry] : modules) {
    compile_request const request{ .language = language,
                                   .source = root / entry.source,
                                   .output = root / entry.module.output_location };

    tui::info("building %s/%s", identifier.c_str(), module_id.c_str());

    auto const start{ std::chrono::steady_clock::now() };
    int const exit_code{ c.compile(request) };
    auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start) };

    KNAPSAC_TRACE_EMIT((trace_events::compiler_invoked{ .package = identifier,
                                                        .module = module_id,
                                                        .exit_code = exit_code,
                                                        .duration_ms = elapsed.count() }));

    if (exit_code != 0) {
      throw registry_error{ registry_errc::build_failed,
                            identifier + "/" + module_id + ": compiler exited with " +
                                std::to_string(exit_code) };
    }
  }
}

void package::add_module(std::filesystem::path relative_source, package_module module) {
  if (relative_source.is_absolute()) {
    throw registry_error{ registry_errc::location_not_relative, relative_source.string() };
  }
  if (modules.contains(module.identifier)) {
    throw registry_error{ registry_errc::module_already_in_registry,
                          identifier + "/" + module.identifier };
  }

  std::string key{ module.identifier };
  modules.emplace(std::move(key),
                  package_entry{ .source = std::move(relative_source),
                                 .module = std::move(module) });
}

package_module const *package::get_module(std::string_view module_id) const {
  auto const it{ modules.find(module_id) };
  return it == modules.end() ? nullptr : &it->second.module;
}

package_module *package::get_module_mut(std::string_view module_id) {
  auto const it{ modules.find(module_id) };
  return it == modules.end() ? nullptr : &it->second.module;
}

std::vector<package_entry const *> package::search_modules(
    std::string_view module_id) const {
  std::vector<package_entry const *> result;
  for (auto const &[id, entry] : modules) {
    if (id == module_id) { result.push_back(&entry); }
  }
  return result;
}

void package::increment_version(version_increment kind) {
  version = version_increment_apply(version, kind);
}

bool package::has_module_source(std::filesystem::path const &package_root,
                                std::filesystem::path const &path) const {
  auto const relative{ util_strip_prefix(package_root, path) };
  if (!relative) {
    throw registry_error{ registry_errc::location_not_under_root,
                          path.string() + " is not under " + package_root.string() };
  }

  for (auto const &[_, entry] : modules) {
    if (entry.source.lexically_normal() == *relative) { return true; }
  }
  return false;
}

package_manifest package::manifest() const {
  return package_manifest{ .identifier = identifier,
                           .version = version,
                           .language = language,
                           .remote_location = remote_location,
                           .modules = modules };
}

}  // namespace knapsac
