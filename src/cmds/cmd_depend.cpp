#include "cmd_depend.h"

#include "cmd_common.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace knapsac {

void cmd_depend::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto const add{ [&app, &on_selected](char const *name, char const *help, bool remove) {
    auto *sub{ app.add_subcommand(name, help) };
    auto cfg_ptr{ std::make_shared<cfg>() };
    cfg_ptr->remove = remove;
    sub->add_option("owner",
                    cfg_ptr->owner,
                    "executable:<path>, module:<id> or package:<package>/<module>")
        ->required();
    sub->add_option("dependency",
                    cfg_ptr->dependency,
                    "stray:<id>=<path>, module:<source> or package:<package>/<module>")
        ->required();
    sub->callback([cfg_ptr, on_selected] { on_selected(*cfg_ptr); });
  } };

  add("depend", "Add a dependency edge", false);
  add("undepend", "Remove a dependency edge", true);
}

cmd_depend::cmd_depend(cmd_depend::cfg cfg,
                       std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_depend::execute() {
  auto const owner{ cli_parse_unit(cfg_.owner) };
  auto dep{ cli_parse_dependency(cfg_.dependency) };

  registry_session session{ cli_registry_ };
  auto key{ session.reg.dependency_key(dep) };

  if (cfg_.remove) {
    session.reg.remove_dependency(owner, key, dep);
  } else {
    session.reg.add_dependency(owner, std::move(key), std::move(dep));
  }
}

}  // namespace knapsac
