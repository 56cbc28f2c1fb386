#include "cmd_add_module.h"

#include "cmd_common.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

void cmd_add_module::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("add-module", "Register a standalone module") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("source", cfg_ptr->source, "Module source file")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("identifier", cfg_ptr->identifier, "Module identifier")->required();
  sub->add_option("output", cfg_ptr->output_location, "Directory receiving the build output")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_add_module::cmd_add_module(cmd_add_module::cfg cfg,
                               std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_add_module::execute() {
  registry_session session{ cli_registry_ };
  session.reg.add_module(standalone_module::create(cfg_.identifier,
                                                   cli_absolute_path(cfg_.source),
                                                   cli_absolute_path(cfg_.output_location)));
}

}  // namespace knapsac
