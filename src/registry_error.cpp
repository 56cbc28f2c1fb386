#include "registry_error.h"

namespace knapsac {

std::string_view registry_errc_name(registry_errc code) {
  switch (code) {
    case registry_errc::location_not_absolute: return "location not absolute";
    case registry_errc::location_not_relative: return "location not relative";
    case registry_errc::location_does_not_exist: return "location does not exist";
    case registry_errc::location_not_directory: return "location not a directory";
    case registry_errc::location_not_under_root: return "location not under root";
    case registry_errc::invalid_identifier: return "invalid identifier";
    case registry_errc::cyclic_dependency: return "cyclic dependency";
    case registry_errc::no_such_dependency: return "no such dependency";
    case registry_errc::module_already_in_registry: return "module already in registry";
    case registry_errc::package_already_exists: return "package already exists";
    case registry_errc::referenced_unit_missing: return "referenced unit missing";
    case registry_errc::non_package_dependency: return "non-package dependency";
    case registry_errc::dependency_key_mismatch: return "dependency key mismatch";
    case registry_errc::registry_path_not_absolute: return "registry path not absolute";
    case registry_errc::registry_path_not_json: return "registry path not a JSON file";
    case registry_errc::registry_path_not_file: return "registry path not a file";
    case registry_errc::invalid_registry: return "invalid registry";
    case registry_errc::build_failed: return "build failed";
    case registry_errc::vcs_failed: return "vcs failed";
    case registry_errc::download_failed: return "download failed";
    case registry_errc::no_remote_location: return "no remote location";
  }
  return "unknown";
}

registry_error::registry_error(registry_errc code, std::string const &detail)
    : std::runtime_error{ std::string{ registry_errc_name(code) } + ": " + detail },
      code_{ code } {}

}  // namespace knapsac
