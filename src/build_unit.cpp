#include "build_unit.h"

#include "registry_error.h"
#include "util.h"

#include <stdexcept>
#include <system_error>

namespace knapsac {

void dependency_holder::add_dependency(std::string identifier, dependency dep) {
  dependencies_.insert_or_assign(std::move(identifier), std::move(dep));
}

std::optional<dependency> dependency_holder::get_dependency(
    std::string_view identifier) const {
  auto const it{ dependencies_.find(identifier) };
  if (it == dependencies_.end()) { return std::nullopt; }
  return it->second;
}

bool dependency_holder::has_dependency(std::string_view identifier) const {
  return dependencies_.find(identifier) != dependencies_.end();
}

bool dependency_holder::remove_dependency(std::string_view identifier,
                                          dependency const &dep) {
  auto const it{ dependencies_.find(identifier) };
  if (it == dependencies_.end() || it->second != dep) { return false; }
  dependencies_.erase(it);
  return true;
}

dependency_map dependency_holder::remove_dependencies_if(
    std::function<bool(dependency const &)> const &pred) {
  dependency_map removed;
  for (auto it{ dependencies_.begin() }; it != dependencies_.end();) {
    if (pred(it->second)) {
      auto node{ dependencies_.extract(it++) };
      removed.insert(std::move(node));
    } else {
      ++it;
    }
  }
  return removed;
}

void validate_identifier(std::string_view identifier) {
  if (identifier.empty() || identifier == "." || identifier == ".." ||
      identifier.find_first_of("/\\") != std::string_view::npos) {
    throw registry_error{ registry_errc::invalid_identifier,
                          "'" + std::string{ identifier } + "'" };
  }
}

standalone_module::standalone_module(std::string identifier_,
                                     std::filesystem::path source_,
                                     std::filesystem::path output_location_)
    : identifier{ std::move(identifier_) },
      source{ std::move(source_) },
      output_location{ std::move(output_location_) } {}

standalone_module standalone_module::create(std::string identifier,
                                            std::filesystem::path source,
                                            std::filesystem::path output_location) {
  validate_identifier(identifier);
  if (!output_location.is_absolute()) {
    throw registry_error{ registry_errc::location_not_absolute, output_location.string() };
  }

  std::error_code ec;
  auto const status{ std::filesystem::status(output_location, ec) };
  if (ec || !std::filesystem::exists(status)) {
    throw registry_error{ registry_errc::location_does_not_exist,
                          output_location.string() };
  }
  if (!std::filesystem::is_directory(status)) {
    throw registry_error{ registry_errc::location_not_directory,
                          output_location.string() };
  }

  return standalone_module{ std::move(identifier),
                            std::move(source),
                            std::move(output_location) };
}

bool standalone_module::has_only_package_module_dependencies() const {
  for (auto const &[_, dep] : dependencies()) {
    if (std::holds_alternative<standalone_dependency>(dep)) { return false; }
  }
  return true;
}

package_module::package_module(std::string identifier_,
                               std::filesystem::path output_location_)
    : identifier{ std::move(identifier_) }, output_location{ std::move(output_location_) } {}

package_module package_module::create(std::string identifier,
                                      std::filesystem::path output_location) {
  validate_identifier(identifier);
  if (!output_location.is_relative()) {
    throw registry_error{ registry_errc::location_not_relative, output_location.string() };
  }
  return package_module{ std::move(identifier), std::move(output_location) };
}

std::string unit_ref_to_string(unit_ref const &ref) {
  return std::visit(match{
                        [](executable_ref const &r) {
                          return "executable:" + r.source.string();
                        },
                        [](module_ref const &r) { return "module:" + r.identifier; },
                        [](package_module_ref const &r) {
                          return "package:" + r.package + "/" + r.module;
                        },
                    },
                    ref);
}

unit_ref unit_ref_parse(std::string_view text) {
  auto const colon{ text.find(':') };
  if (colon == std::string_view::npos || colon + 1 == text.size()) {
    throw std::runtime_error("unit '" + std::string{ text } +
                             "' must be executable:<path>, module:<id> or "
                             "package:<package>/<module>");
  }

  std::string_view const kind{ text.substr(0, colon) };
  std::string_view const body{ text.substr(colon + 1) };

  if (kind == "executable") { return executable_ref{ std::filesystem::path{ body } }; }
  if (kind == "module") { return module_ref{ std::string{ body } }; }
  if (kind == "package") {
    auto const slash{ body.find('/') };
    if (slash == std::string_view::npos || slash == 0 || slash + 1 == body.size()) {
      throw std::runtime_error("package unit must be package:<package>/<module>: " +
                               std::string{ text });
    }
    return package_module_ref{ std::string{ body.substr(0, slash) },
                               std::string{ body.substr(slash + 1) } };
  }

  throw std::runtime_error("unknown unit kind '" + std::string{ kind } + "'");
}

}  // namespace knapsac
