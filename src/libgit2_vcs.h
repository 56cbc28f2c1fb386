#pragma once

#include "vcs.h"

namespace knapsac {

// vcs backed by libgit2. Requires a live libgit2_scope.
class libgit2_vcs : public vcs {
 public:
  std::optional<repository> discover(std::filesystem::path const &path) override;
  repository open_or_init(std::filesystem::path const &path) override;
  repository clone(std::string const &url, std::filesystem::path const &dest) override;
  std::vector<std::string> remotes(repository const &repo) override;
  void add_remote(repository const &repo,
                  std::string const &name,
                  std::string const &url) override;
  void commit(repository const &repo,
              std::string const &message,
              std::vector<std::filesystem::path> const &paths) override;
  void tag(repository const &repo, std::string const &name) override;
  std::string current_branch(repository const &repo) override;
  void push(repository const &repo,
            std::string const &remote,
            std::string const &branch) override;
};

}  // namespace knapsac
