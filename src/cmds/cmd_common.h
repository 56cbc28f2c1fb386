#pragma once

#include "platform.h"
#include "registry.h"
#include "store.h"
#include "util.h"

#include <filesystem>
#include <optional>
#include <string_view>

namespace knapsac {

// Registry opened for one command. The lock is held for the session's lifetime so the
// load-mutate-save sequence is atomic with respect to other knapsac processes.
struct registry_session : unmovable {
  explicit registry_session(std::optional<std::filesystem::path> const &cli_registry);

  file_store store;
  platform::file_lock lock;
  registry reg;
};

// Absolute, lexically normalized form of a user-supplied path.
std::filesystem::path cli_absolute_path(std::filesystem::path const &path);

// unit_ref_parse / dependency_parse with any embedded path made absolute.
unit_ref cli_parse_unit(std::string_view text);
dependency cli_parse_dependency(std::string_view text);

}  // namespace knapsac
