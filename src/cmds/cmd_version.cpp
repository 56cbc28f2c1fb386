#include "cmd_version.h"

#include "tui.h"

#include <CLI/CLI.hpp>
#include <git2.h>
#include <nlohmann/json.hpp>

#ifndef KNAPSAC_VERSION_STR
#error "KNAPSAC_VERSION_STR must be defined by the build system"
#endif

namespace knapsac {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, std::optional<std::filesystem::path> const &)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("knapsac version %s", KNAPSAC_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");

  int git_major{ 0 };
  int git_minor{ 0 };
  int git_revision{ 0 };
  git_libgit2_version(&git_major, &git_minor, &git_revision);
  tui::info("  libgit2: %d.%d.%d", git_major, git_minor, git_revision);

  tui::info("  nlohmann/json: %d.%d.%d",
            NLOHMANN_JSON_VERSION_MAJOR,
            NLOHMANN_JSON_VERSION_MINOR,
            NLOHMANN_JSON_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace knapsac
