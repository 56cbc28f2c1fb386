#include "registry_json.h"

#include "registry_error.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace knapsac {

namespace {

using json = nlohmann::ordered_json;

[[noreturn]] void malformed(std::string const &what) {
  throw registry_error{ registry_errc::invalid_registry, what };
}

json const &require(json const &j, char const *key) {
  if (!j.is_object()) { malformed(std::string{ "expected object holding '" } + key + "'"); }
  auto const it{ j.find(key) };
  if (it == j.end()) { malformed(std::string{ "missing field '" } + key + "'"); }
  return *it;
}

std::string require_string(json const &j, char const *key) {
  auto const &value{ require(j, key) };
  if (!value.is_string()) { malformed(std::string{ "field '" } + key + "' is not a string"); }
  return value.get<std::string>();
}

json const *optional_object(json const &j, char const *key) {
  auto const it{ j.find(key) };
  if (it == j.end() || it->is_null()) { return nullptr; }
  if (!it->is_object()) { malformed(std::string{ "field '" } + key + "' is not an object"); }
  return &*it;
}

// dependency <-> {"kind": ..., payload}

json dependency_to(dependency const &dep) {
  return std::visit(match{
                        [](stray_dependency const &d) {
                          return json{ { "kind", "stray" },
                                       { "identifier", d.identifier },
                                       { "output_location", d.output_location.string() } };
                        },
                        [](standalone_dependency const &d) {
                          return json{ { "kind", "standalone" },
                                       { "source", d.source.string() } };
                        },
                        [](package_dependency const &d) {
                          return json{ { "kind", "package" },
                                       { "package", d.package },
                                       { "module", d.module } };
                        },
                    },
                    dep);
}

dependency dependency_from(json const &j) {
  std::string const kind{ require_string(j, "kind") };
  if (kind == "stray") {
    return stray_dependency{ require_string(j, "identifier"),
                             require_string(j, "output_location") };
  }
  if (kind == "standalone") { return standalone_dependency{ require_string(j, "source") }; }
  if (kind == "package") {
    return package_dependency{ require_string(j, "package"), require_string(j, "module") };
  }
  malformed("unknown dependency kind '" + kind + "'");
}

json dependencies_to(dependency_holder const &holder) {
  json deps = json::object();
  for (auto const &[id, dep] : holder.dependencies()) { deps[id] = dependency_to(dep); }
  return deps;
}

void dependencies_from(json const &j, dependency_holder &holder) {
  json const *deps{ optional_object(j, "dependencies") };
  if (!deps) { return; }
  for (auto const &[id, dep] : deps->items()) { holder.add_dependency(id, dependency_from(dep)); }
}

json language_to(language_cfg const &language) {
  return json{ { "compiler_command", language.compiler_command },
               { "output_option", language.output_option } };
}

language_cfg language_from(json const &j) {
  return language_cfg{ require_string(j, "compiler_command"),
                       require_string(j, "output_option") };
}

version_t version_from(json const &j) {
  std::string const text{ require_string(j, "version") };
  auto parsed{ version_parse(text) };
  if (!parsed) { malformed("unparseable version '" + text + "'"); }
  return *parsed;
}

json remote_to(std::optional<std::string> const &remote) {
  return remote ? json(*remote) : json(nullptr);
}

std::optional<std::string> remote_from(json const &j) {
  auto const it{ j.find("remote_location") };
  if (it == j.end() || it->is_null()) { return std::nullopt; }
  if (!it->is_string()) { malformed("field 'remote_location' is not a string"); }
  return it->get<std::string>();
}

json package_modules_to(package_module_map const &modules) {
  json result = json::object();
  for (auto const &[id, entry] : modules) {
    result[id] = json{ { "source", entry.source.string() },
                       { "module",
                         json{ { "identifier", entry.module.identifier },
                               { "output_location", entry.module.output_location.string() },
                               { "dependencies", dependencies_to(entry.module) } } } };
  }
  return result;
}

package_module_map package_modules_from(json const &j) {
  package_module_map result;
  json const *modules{ optional_object(j, "modules") };
  if (!modules) { return result; }

  for (auto const &[id, value] : modules->items()) {
    auto const &module_json{ require(value, "module") };
    package_module module{ require_string(module_json, "identifier"),
                           require_string(module_json, "output_location") };
    if (module.identifier != id) {
      malformed("package module key '" + id + "' does not match identifier '" +
                module.identifier + "'");
    }
    dependencies_from(module_json, module);
    result.emplace(id,
                   package_entry{ .source = require_string(value, "source"),
                                  .module = std::move(module) });
  }
  return result;
}

json manifest_to(package_manifest const &manifest) {
  return json{ { "identifier", manifest.identifier },
               { "version", version_to_string(manifest.version) },
               { "language", language_to(manifest.language) },
               { "remote_location", remote_to(manifest.remote_location) },
               { "modules", package_modules_to(manifest.modules) } };
}

package_manifest manifest_from(json const &j) {
  return package_manifest{ .identifier = require_string(j, "identifier"),
                           .version = version_from(j),
                           .language = language_from(require(j, "language")),
                           .remote_location = remote_from(j),
                           .modules = package_modules_from(j) };
}

json parse_document(std::string_view text) {
  try {
    return json::parse(text);
  } catch (json::exception const &e) {
    malformed(e.what());
  }
}

}  // namespace

std::string registry_to_json(registry_snapshot const &snapshot) {
  json modules = json::object();
  for (auto const &[id, module] : snapshot.modules) {
    modules[id] = json{ { "identifier", module.identifier },
                        { "source", module.source.string() },
                        { "output_location", module.output_location.string() },
                        { "dependencies", dependencies_to(module) } };
  }

  json executables = json::object();
  for (auto const &[source, exe] : snapshot.executables) {
    executables[source.string()] = json{ { "dependencies", dependencies_to(exe) } };
  }

  json packages = json::object();
  for (auto const &[id, pkg] : snapshot.packages) {
    json entry = manifest_to(pkg.manifest());
    entry["root"] = pkg.root.string();
    packages[id] = std::move(entry);
  }

  json const doc{ { "modules", std::move(modules) },
                  { "executables", std::move(executables) },
                  { "packages", std::move(packages) } };
  return doc.dump(2);
}

registry_snapshot registry_from_json(std::string_view text) {
  json const doc = parse_document(text);
  if (!doc.is_object()) { malformed("registry document is not an object"); }

  registry_snapshot snapshot;

  try {
    if (json const *modules{ optional_object(doc, "modules") }) {
      for (auto const &[id, value] : modules->items()) {
        standalone_module module{ require_string(value, "identifier"),
                                  require_string(value, "source"),
                                  require_string(value, "output_location") };
        if (module.identifier != id) {
          malformed("module key '" + id + "' does not match identifier '" +
                    module.identifier + "'");
        }
        dependencies_from(value, module);
        snapshot.modules.emplace(id, std::move(module));
      }
    }

    if (json const *executables{ optional_object(doc, "executables") }) {
      for (auto const &[source, value] : executables->items()) {
        executable exe;
        dependencies_from(value, exe);
        snapshot.executables.emplace(std::filesystem::path{ source }, std::move(exe));
      }
    }

    if (json const *packages{ optional_object(doc, "packages") }) {
      for (auto const &[id, value] : packages->items()) {
        package pkg{ package::from_manifest(manifest_from(value),
                                            require_string(value, "root")) };
        if (pkg.identifier != id) {
          malformed("package key '" + id + "' does not match identifier '" +
                    pkg.identifier + "'");
        }
        snapshot.packages.emplace(id, std::move(pkg));
      }
    }
  } catch (json::exception const &e) {
    malformed(e.what());
  }

  return snapshot;
}

std::string manifest_to_json(package_manifest const &manifest) {
  return manifest_to(manifest).dump(2);
}

package_manifest manifest_from_json(std::string_view text) {
  json const doc = parse_document(text);
  try {
    return manifest_from(doc);
  } catch (json::exception const &e) {
    malformed(e.what());
  }
}

}  // namespace knapsac
