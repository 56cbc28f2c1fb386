#include "cmd_mark.h"

#include "cmd_common.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

void cmd_mark::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("mark", "Turn a registered executable into a module") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("source", cfg_ptr->source, "Executable source file")->required();
  sub->add_option("identifier", cfg_ptr->identifier, "Module identifier")->required();
  sub->add_option("output", cfg_ptr->output_location, "Directory receiving the build output")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_mark::cmd_mark(cmd_mark::cfg cfg,
                   std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_mark::execute() {
  registry_session session{ cli_registry_ };
  session.reg.mark_as_module(cli_absolute_path(cfg_.source),
                             cfg_.identifier,
                             cli_absolute_path(cfg_.output_location));
}

}  // namespace knapsac
