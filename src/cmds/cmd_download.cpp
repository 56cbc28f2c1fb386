#include "cmd_download.h"

#include "cmd_common.h"
#include "libgit2_vcs.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

void cmd_download::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("download", "Clone a package and register it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("url", cfg_ptr->url, "Repository URL")->required();
  sub->add_option("destination",
                  cfg_ptr->destination,
                  "Directory receiving the clone (defaults to current directory)")
      ->check(CLI::ExistingDirectory);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_download::cmd_download(cmd_download::cfg cfg,
                           std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_download::execute() {
  auto const destination{ cli_absolute_path(
      cfg_.destination.value_or(std::filesystem::current_path())) };

  registry_session session{ cli_registry_ };
  libgit2_vcs git;
  auto const id{ session.reg.download(cfg_.url, destination, git) };
  tui::print_stdout("%s\n", id.c_str());
}

}  // namespace knapsac
