#include "libgit2_util.h"

#include "registry_error.h"

#include <git2.h>

namespace knapsac {

libgit2_scope::libgit2_scope() { git_libgit2_init(); }
libgit2_scope::~libgit2_scope() { git_libgit2_shutdown(); }

std::string libgit2_error_message(std::string const &what) {
  std::string msg{ what };
  if (git_error const *git_err{ git_error_last() }; git_err && git_err->message) {
    msg += ": ";
    msg += git_err->message;
  }
  return msg;
}

void libgit2_check(int rc, std::string const &what) {
  if (rc < 0) {
    throw registry_error{ registry_errc::vcs_failed, libgit2_error_message(what) };
  }
}

}  // namespace knapsac
