#include "libgit2_vcs.h"

#include "libgit2_util.h"
#include "registry_error.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <git2.h>

#include <memory>
#include <string_view>

namespace knapsac {

namespace {

using repo_ptr_t = std::unique_ptr<git_repository, decltype(&git_repository_free)>;
using index_ptr_t = std::unique_ptr<git_index, decltype(&git_index_free)>;
using tree_ptr_t = std::unique_ptr<git_tree, decltype(&git_tree_free)>;
using commit_ptr_t = std::unique_ptr<git_commit, decltype(&git_commit_free)>;
using signature_ptr_t = std::unique_ptr<git_signature, decltype(&git_signature_free)>;
using object_ptr_t = std::unique_ptr<git_object, decltype(&git_object_free)>;
using remote_ptr_t = std::unique_ptr<git_remote, decltype(&git_remote_free)>;
using reference_ptr_t = std::unique_ptr<git_reference, decltype(&git_reference_free)>;

constexpr std::string_view kHeadsPrefix{ "refs/heads/" };

void trace_step(std::filesystem::path const &workdir,
                std::string step,
                std::string detail) {
  KNAPSAC_TRACE_EMIT((trace_events::vcs_step{ .repository = workdir.string(),
                                              .step = std::move(step),
                                              .detail = std::move(detail) }));
}

repo_ptr_t open_repository(std::filesystem::path const &workdir) {
  git_repository *raw{ nullptr };
  libgit2_check(git_repository_open_ext(&raw,
                                        workdir.string().c_str(),
                                        GIT_REPOSITORY_OPEN_NO_SEARCH,
                                        nullptr),
                "failed to open repository " + workdir.string());
  return repo_ptr_t{ raw, git_repository_free };
}

std::filesystem::path workdir_of(git_repository *repo) {
  char const *workdir{ git_repository_workdir(repo) };
  if (!workdir) {
    throw registry_error{ registry_errc::vcs_failed,
                          std::string{ "bare repository at " } + git_repository_path(repo) };
  }
  // libgit2 reports the workdir with a trailing separator.
  auto result{ std::filesystem::path{ workdir }.lexically_normal() };
  if (!result.has_filename()) { result = result.parent_path(); }
  return result;
}

signature_ptr_t make_signature(git_repository *repo) {
  git_signature *raw{ nullptr };
  if (git_signature_default(&raw, repo) < 0) {
    // No user.name/user.email configured
    libgit2_check(git_signature_now(&raw, "knapsac", "knapsac@localhost"),
                  "failed to create commit signature");
  }
  return signature_ptr_t{ raw, git_signature_free };
}

// Pathspec relative to the workdir; the workdir itself becomes "*".
std::string pathspec_for(std::filesystem::path const &workdir,
                         std::filesystem::path const &path) {
  if (path.is_relative()) { return path.generic_string(); }
  auto const relative{ util_strip_prefix(workdir, path) };
  if (!relative) {
    throw registry_error{ registry_errc::vcs_failed,
                          path.string() + " is outside repository " + workdir.string() };
  }
  return relative->empty() ? std::string{ "*" } : relative->generic_string();
}

int credentials_from_agent(git_credential **out,
                           char const *,
                           char const *username_from_url,
                           unsigned int allowed_types,
                           void *) {
  if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && username_from_url) {
    return git_credential_ssh_key_from_agent(out, username_from_url);
  }
  if (allowed_types & GIT_CREDENTIAL_DEFAULT) { return git_credential_default_new(out); }
  return GIT_PASSTHROUGH;
}

}  // namespace

std::optional<repository> libgit2_vcs::discover(std::filesystem::path const &path) {
  git_buf buf{};
  int const rc{ git_repository_discover(&buf, path.string().c_str(), 0, nullptr) };
  if (rc == GIT_ENOTFOUND) { return std::nullopt; }
  libgit2_check(rc, "failed to discover repository from " + path.string());

  std::string const git_dir{ buf.ptr, buf.size };
  git_buf_dispose(&buf);

  git_repository *raw{ nullptr };
  libgit2_check(git_repository_open(&raw, git_dir.c_str()),
                "failed to open repository " + git_dir);
  repo_ptr_t repo{ raw, git_repository_free };

  if (git_repository_is_bare(repo.get())) { return std::nullopt; }
  return repository{ workdir_of(repo.get()) };
}

repository libgit2_vcs::open_or_init(std::filesystem::path const &path) {
  git_repository *raw{ nullptr };
  int const rc{ git_repository_open_ext(&raw,
                                        path.string().c_str(),
                                        GIT_REPOSITORY_OPEN_NO_SEARCH,
                                        nullptr) };
  if (rc == GIT_ENOTFOUND) {
    tui::info("initializing git repository in %s", path.string().c_str());
    libgit2_check(git_repository_init(&raw, path.string().c_str(), 0),
                  "failed to initialize repository " + path.string());
    trace_step(path, "init", "");
  } else {
    libgit2_check(rc, "failed to open repository " + path.string());
  }

  repo_ptr_t repo{ raw, git_repository_free };
  return repository{ workdir_of(repo.get()) };
}

repository libgit2_vcs::clone(std::string const &url, std::filesystem::path const &dest) {
  git_clone_options clone_opts;
  git_clone_options_init(&clone_opts, GIT_CLONE_OPTIONS_VERSION);
  clone_opts.fetch_opts.callbacks.credentials = credentials_from_agent;

  tui::info("cloning %s into %s", url.c_str(), dest.string().c_str());

  git_repository *raw{ nullptr };
  libgit2_check(git_clone(&raw, url.c_str(), dest.string().c_str(), &clone_opts),
                "clone of " + url + " failed");
  repo_ptr_t repo{ raw, git_repository_free };

  trace_step(dest, "clone", url);
  return repository{ workdir_of(repo.get()) };
}

std::vector<std::string> libgit2_vcs::remotes(repository const &repo) {
  auto const handle{ open_repository(repo.workdir) };

  git_strarray names{};
  libgit2_check(git_remote_list(&names, handle.get()), "failed to list remotes");

  std::vector<std::string> result;
  result.reserve(names.count);
  for (size_t i{ 0 }; i < names.count; ++i) { result.emplace_back(names.strings[i]); }
  git_strarray_dispose(&names);
  return result;
}

void libgit2_vcs::add_remote(repository const &repo,
                             std::string const &name,
                             std::string const &url) {
  auto const handle{ open_repository(repo.workdir) };

  git_remote *raw{ nullptr };
  libgit2_check(git_remote_create(&raw, handle.get(), name.c_str(), url.c_str()),
                "failed to add remote " + name);
  remote_ptr_t remote{ raw, git_remote_free };

  trace_step(repo.workdir, "add_remote", name + "=" + url);
}

void libgit2_vcs::commit(repository const &repo,
                         std::string const &message,
                         std::vector<std::filesystem::path> const &paths) {
  auto const handle{ open_repository(repo.workdir) };

  git_index *index_raw{ nullptr };
  libgit2_check(git_repository_index(&index_raw, handle.get()), "failed to open index");
  index_ptr_t index{ index_raw, git_index_free };

  std::vector<std::string> specs;
  specs.reserve(paths.size());
  for (auto const &path : paths) { specs.push_back(pathspec_for(repo.workdir, path)); }

  std::vector<char *> spec_ptrs;
  spec_ptrs.reserve(specs.size());
  for (auto &spec : specs) { spec_ptrs.push_back(spec.data()); }
  git_strarray const pathspec{ spec_ptrs.data(), spec_ptrs.size() };

  libgit2_check(
      git_index_add_all(index.get(), &pathspec, GIT_INDEX_ADD_DEFAULT, nullptr, nullptr),
      "failed to stage files");
  libgit2_check(git_index_write(index.get()), "failed to write index");

  git_oid tree_oid;
  libgit2_check(git_index_write_tree(&tree_oid, index.get()), "failed to write tree");

  git_tree *tree_raw{ nullptr };
  libgit2_check(git_tree_lookup(&tree_raw, handle.get(), &tree_oid),
                "failed to look up tree");
  tree_ptr_t tree{ tree_raw, git_tree_free };

  auto const signature{ make_signature(handle.get()) };

  // An unborn HEAD (fresh repository) has no parent.
  commit_ptr_t parent{ nullptr, git_commit_free };
  git_oid parent_oid;
  int const head_rc{ git_reference_name_to_id(&parent_oid, handle.get(), "HEAD") };
  if (head_rc == 0) {
    git_commit *parent_raw{ nullptr };
    libgit2_check(git_commit_lookup(&parent_raw, handle.get(), &parent_oid),
                  "failed to look up HEAD commit");
    parent.reset(parent_raw);
  } else if (head_rc != GIT_ENOTFOUND && head_rc != GIT_EUNBORNBRANCH) {
    libgit2_check(head_rc, "failed to resolve HEAD");
  }

  git_oid commit_oid;
  int const rc{ parent ? git_commit_create_v(&commit_oid,
                                             handle.get(),
                                             "HEAD",
                                             signature.get(),
                                             signature.get(),
                                             nullptr,
                                             message.c_str(),
                                             tree.get(),
                                             1,
                                             parent.get())
                       : git_commit_create_v(&commit_oid,
                                             handle.get(),
                                             "HEAD",
                                             signature.get(),
                                             signature.get(),
                                             nullptr,
                                             message.c_str(),
                                             tree.get(),
                                             0) };
  libgit2_check(rc, "failed to create commit");

  char oid_str[GIT_OID_HEXSZ + 1]{};
  git_oid_tostr(oid_str, sizeof oid_str, &commit_oid);
  tui::debug("committed %s in %s: %s",
             oid_str,
             repo.workdir.string().c_str(),
             message.c_str());
  trace_step(repo.workdir, "commit", message);
}

void libgit2_vcs::tag(repository const &repo, std::string const &name) {
  auto const handle{ open_repository(repo.workdir) };

  git_object *head_raw{ nullptr };
  libgit2_check(git_revparse_single(&head_raw, handle.get(), "HEAD"),
                "failed to resolve HEAD for tag " + name);
  object_ptr_t head{ head_raw, git_object_free };

  git_oid tag_oid;
  libgit2_check(
      git_tag_create_lightweight(&tag_oid, handle.get(), name.c_str(), head.get(), 0),
      "failed to create tag " + name);
  trace_step(repo.workdir, "tag", name);
}

std::string libgit2_vcs::current_branch(repository const &repo) {
  auto const handle{ open_repository(repo.workdir) };

  // HEAD is symbolic even before the first commit; read its target directly.
  git_reference *head_raw{ nullptr };
  libgit2_check(git_reference_lookup(&head_raw, handle.get(), "HEAD"),
                "failed to read HEAD");
  reference_ptr_t head{ head_raw, git_reference_free };

  char const *target{ git_reference_symbolic_target(head.get()) };
  if (!target) {
    throw registry_error{ registry_errc::vcs_failed,
                          "HEAD is detached in " + repo.workdir.string() };
  }

  std::string_view name{ target };
  if (name.starts_with(kHeadsPrefix)) { name.remove_prefix(kHeadsPrefix.size()); }
  return std::string{ name };
}

void libgit2_vcs::push(repository const &repo,
                       std::string const &remote_name,
                       std::string const &branch) {
  auto const handle{ open_repository(repo.workdir) };

  git_remote *remote_raw{ nullptr };
  libgit2_check(git_remote_lookup(&remote_raw, handle.get(), remote_name.c_str()),
                "no remote named " + remote_name);
  remote_ptr_t remote{ remote_raw, git_remote_free };

  git_push_options push_opts;
  git_push_options_init(&push_opts, GIT_PUSH_OPTIONS_VERSION);
  push_opts.callbacks.credentials = credentials_from_agent;

  std::string refspec{ "refs/heads/" + branch + ":refs/heads/" + branch };
  char *refspec_ptr{ refspec.data() };
  git_strarray const refspecs{ &refspec_ptr, 1 };

  tui::info("pushing %s to %s", branch.c_str(), remote_name.c_str());
  libgit2_check(git_remote_push(remote.get(), &refspecs, &push_opts),
                "push of " + branch + " to " + remote_name + " failed");

  // Mirror `git push -u`: track the pushed branch.
  git_reference *branch_raw{ nullptr };
  libgit2_check(
      git_branch_lookup(&branch_raw, handle.get(), branch.c_str(), GIT_BRANCH_LOCAL),
      "failed to look up branch " + branch);
  reference_ptr_t branch_ref{ branch_raw, git_reference_free };
  std::string const upstream{ remote_name + "/" + branch };
  libgit2_check(git_branch_set_upstream(branch_ref.get(), upstream.c_str()),
                "failed to set upstream of " + branch);

  trace_step(repo.workdir, "push", remote_name + " " + branch);
}

}  // namespace knapsac
