#include "cmd_common.h"

#include "tui.h"
#include "util.h"

namespace knapsac {

registry_session::registry_session(
    std::optional<std::filesystem::path> const &cli_registry)
    : store{ resolve_registry_path(cli_registry) }, lock{ store.lock() }, reg{ store } {
  tui::debug("using registry %s", store.describe().c_str());
}

std::filesystem::path cli_absolute_path(std::filesystem::path const &path) {
  return std::filesystem::absolute(path).lexically_normal();
}

unit_ref cli_parse_unit(std::string_view text) {
  auto unit{ unit_ref_parse(text) };
  if (auto *exe{ std::get_if<executable_ref>(&unit) }) {
    exe->source = cli_absolute_path(exe->source);
  }
  return unit;
}

dependency cli_parse_dependency(std::string_view text) {
  auto dep{ dependency_parse(text) };
  std::visit(match{
                 [](stray_dependency &d) {
                   d.output_location = cli_absolute_path(d.output_location);
                 },
                 [](standalone_dependency &d) { d.source = cli_absolute_path(d.source); },
                 [](package_dependency &) {},
             },
             dep);
  return dep;
}

}  // namespace knapsac
