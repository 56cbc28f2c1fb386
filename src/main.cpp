#include "cli.h"
#include "libgit2_util.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  knapsac::tui::init();

  auto args{ knapsac::cli_parse(argc, argv) };
  try {
    knapsac::tui::configure_trace_outputs(args.trace_outputs);
  } catch (std::exception const &ex) {
    knapsac::tui::error("Trace setup failed: %s", ex.what());
    return EXIT_FAILURE;
  }
  knapsac::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  knapsac::libgit2_scope git_guard;

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      knapsac::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    knapsac::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [&](auto const &cfg) { return knapsac::cmd::create(cfg, args.registry_path); },
      *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    knapsac::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
