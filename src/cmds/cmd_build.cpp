#include "cmd_build.h"

#include "cmd_common.h"
#include "compiler.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

void cmd_build::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("build", "Compile every module of a package") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("identifier", cfg_ptr->identifier, "Package identifier")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_build::cmd_build(cmd_build::cfg cfg,
                     std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_build::execute() {
  registry_session session{ cli_registry_ };
  process_compiler cc;
  session.reg.build_package(cfg_.identifier, cc);
}

}  // namespace knapsac
