#pragma once

#include "util.h"

#include <string>

namespace knapsac {

// RAII wrapper for libgit2 global initialization/shutdown.
struct libgit2_scope : unmovable {
  libgit2_scope();
  ~libgit2_scope();
};

// "<what>: <git_error_last message>"
std::string libgit2_error_message(std::string const &what);

// Throws registry_error(vcs_failed) if `rc` is negative.
void libgit2_check(int rc, std::string const &what);

}  // namespace knapsac
