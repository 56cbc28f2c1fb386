#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace knapsac {

enum class registry_errc {
  // validation
  location_not_absolute,
  location_not_relative,
  location_does_not_exist,
  location_not_directory,
  location_not_under_root,
  invalid_identifier,

  // graph
  cyclic_dependency,
  no_such_dependency,
  module_already_in_registry,
  package_already_exists,
  referenced_unit_missing,
  non_package_dependency,
  dependency_key_mismatch,

  // persistence
  registry_path_not_absolute,
  registry_path_not_json,
  registry_path_not_file,
  invalid_registry,

  // collaborators
  build_failed,
  vcs_failed,
  download_failed,
  no_remote_location,
};

std::string_view registry_errc_name(registry_errc code);

// All registry, persistence and collaborator failures surface as this type. what() is
// "<kind>: <detail>".
class registry_error : public std::runtime_error {
 public:
  registry_error(registry_errc code, std::string const &detail);

  registry_errc code() const { return code_; }

 private:
  registry_errc code_;
};

}  // namespace knapsac
