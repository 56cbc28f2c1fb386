#include "cmd_upload.h"

#include "cmd_common.h"
#include "libgit2_vcs.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

void cmd_upload::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("upload", "Push a package to its remote repository") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("identifier", cfg_ptr->identifier, "Package identifier")->required();
  sub->add_option("remote",
                  cfg_ptr->remote,
                  "Remote URL (required on the first upload)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_upload::cmd_upload(cmd_upload::cfg cfg,
                       std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_upload::execute() {
  registry_session session{ cli_registry_ };
  libgit2_vcs git;
  session.reg.upload(cfg_.identifier, cfg_.remote, git);
}

}  // namespace knapsac
