#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace knapsac {

struct repository {
  std::filesystem::path workdir;
};

// Version-control collaborator used by packaging, publishing, uploading and downloading.
// Every failure throws registry_error(vcs_failed); nothing is rolled back.
class vcs {
 public:
  virtual ~vcs() = default;

  // Repository enclosing `path`, searching upwards; nullopt if there is none.
  virtual std::optional<repository> discover(std::filesystem::path const &path) = 0;

  // Repository rooted exactly at `path`, initialized if absent.
  virtual repository open_or_init(std::filesystem::path const &path) = 0;

  virtual repository clone(std::string const &url, std::filesystem::path const &dest) = 0;

  virtual std::vector<std::string> remotes(repository const &repo) = 0;
  virtual void add_remote(repository const &repo,
                          std::string const &name,
                          std::string const &url) = 0;

  // Stages `paths` (files or directories, absolute or relative to the workdir) and
  // commits them on the current branch.
  virtual void commit(repository const &repo,
                      std::string const &message,
                      std::vector<std::filesystem::path> const &paths) = 0;

  // Lightweight tag on HEAD.
  virtual void tag(repository const &repo, std::string const &name) = 0;

  virtual std::string current_branch(repository const &repo) = 0;

  virtual void push(repository const &repo,
                    std::string const &remote,
                    std::string const &branch) = 0;
};

}  // namespace knapsac
