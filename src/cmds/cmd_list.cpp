#include "cmd_list.h"

#include "cmd_common.h"
#include "registry_json.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

namespace {

void print_dependencies(dependency_holder const &holder, char const *indent) {
  for (auto const &[id, dep] : holder.dependencies()) {
    tui::print_stdout("%s%s -> %s\n", indent, id.c_str(), dependency_to_string(dep).c_str());
  }
}

}  // namespace

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "Print every registered unit and its edges") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_flag("--json", cfg_ptr->json, "Print the raw registry document");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_list::cmd_list(cmd_list::cfg cfg,
                   std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_list::execute() {
  registry_session session{ cli_registry_ };
  auto const &state{ session.reg.snapshot() };

  if (cfg_.json) {
    tui::print_stdout("%s\n", registry_to_json(state).c_str());
    return;
  }

  for (auto const &[id, module] : state.modules) {
    tui::print_stdout("module %s  %s -> %s\n",
                      id.c_str(),
                      module.source.string().c_str(),
                      module.output_location.string().c_str());
    print_dependencies(module, "    ");
  }

  for (auto const &[source, exe] : state.executables) {
    tui::print_stdout("executable %s\n", source.string().c_str());
    print_dependencies(exe, "    ");
  }

  for (auto const &[id, pkg] : state.packages) {
    tui::print_stdout("package %s %s  %s%s%s\n",
                      id.c_str(),
                      version_to_string(pkg.version).c_str(),
                      pkg.root.string().c_str(),
                      pkg.remote_location ? "  " : "",
                      pkg.remote_location ? pkg.remote_location->c_str() : "");
    for (auto const &[module_id, entry] : pkg.modules) {
      tui::print_stdout("  %s  %s -> %s\n",
                        module_id.c_str(),
                        entry.source.string().c_str(),
                        entry.module.output_location.string().c_str());
      print_dependencies(entry.module, "      ");
    }
  }
}

}  // namespace knapsac
