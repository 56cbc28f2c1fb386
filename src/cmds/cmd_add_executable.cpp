#include "cmd_add_executable.h"

#include "cmd_common.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

void cmd_add_executable::register_cli(CLI::App &app,
                                      std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("add-executable", "Register an executable source") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("source", cfg_ptr->source, "Executable source file")
      ->required()
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_add_executable::cmd_add_executable(
    cmd_add_executable::cfg cfg,
    std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_add_executable::execute() {
  registry_session session{ cli_registry_ };
  session.reg.add_executable(cli_absolute_path(cfg_.source));
}

}  // namespace knapsac
