#include "cmd_package.h"

#include "cmd_common.h"
#include "compiler.h"
#include "libgit2_vcs.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

void cmd_package::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("package",
                                "Move every module under a directory into a new package") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("identifier", cfg_ptr->identifier, "Package identifier")->required();
  sub->add_option("root", cfg_ptr->root, "Package root directory")
      ->required()
      ->check(CLI::ExistingDirectory);
  sub->add_option("--compiler", cfg_ptr->compiler_command, "Compiler command")
      ->required();
  sub->add_option("--output-option",
                  cfg_ptr->output_option,
                  "Flag that precedes the output path (e.g. -o)")
      ->default_val("-o");
  sub->add_flag("--build", cfg_ptr->build, "Compile every module once packaged");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_package::cmd_package(cmd_package::cfg cfg,
                         std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_package::execute() {
  registry_session session{ cli_registry_ };
  libgit2_vcs git;
  process_compiler cc;
  session.reg.promote_to_package(cfg_.identifier,
                                 cli_absolute_path(cfg_.root),
                                 language_cfg{ .compiler_command = cfg_.compiler_command,
                                               .output_option = cfg_.output_option },
                                 git,
                                 cfg_.build ? &cc : nullptr);
}

}  // namespace knapsac
