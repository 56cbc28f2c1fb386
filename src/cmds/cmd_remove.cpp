#include "cmd_remove.h"

#include "cmd_common.h"

#include <CLI/CLI.hpp>

#include <memory>
#include <string_view>

namespace knapsac {

void cmd_remove::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("remove", "Remove a unit and every edge pointing at it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("unit",
                  cfg_ptr->unit,
                  "executable:<path>, module:<id>, package:<package> or "
                  "package:<package>/<module>")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_remove::cmd_remove(cmd_remove::cfg cfg,
                       std::optional<std::filesystem::path> const &cli_registry)
    : cfg_{ std::move(cfg) }, cli_registry_{ cli_registry } {}

void cmd_remove::execute() {
  constexpr std::string_view kPackagePrefix{ "package:" };
  std::string_view const text{ cfg_.unit };

  if (text.starts_with(kPackagePrefix) &&
      text.find('/', kPackagePrefix.size()) == std::string_view::npos) {
    registry_session session{ cli_registry_ };
    session.reg.remove_package(text.substr(kPackagePrefix.size()));
    return;
  }

  auto const unit{ cli_parse_unit(text) };
  registry_session session{ cli_registry_ };
  session.reg.remove_item(unit);
}

}  // namespace knapsac
