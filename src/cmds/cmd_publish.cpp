#include "cmd_publish.h"

#include "cmd_common.h"
#include "libgit2_vcs.h"

#include <CLI/CLI.hpp>

#include <memory>
#include <stdexcept>

namespace knapsac {

void cmd_publish::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("publish", "Bump a package version, commit and tag it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("identifier", cfg_ptr->identifier, "Package identifier")->required();
  sub->add_option("increment", cfg_ptr->increment, "major, minor or patch")
      ->check(CLI::IsMember({ "major", "minor", "patch" }));
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_publish::cmd_publish(cmd_publish::cfg cfg,
                         std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_publish::execute() {
  auto const kind{ version_increment_parse(cfg_.increment) };
  if (!kind) { throw std::runtime_error("publish: unknown increment " + cfg_.increment); }

  registry_session session{ cli_registry_ };
  libgit2_vcs git;
  session.reg.publish(cfg_.identifier, *kind, git);
}

}  // namespace knapsac
