#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace knapsac {

// `depend` adds an edge, `undepend` removes it.
class cmd_depend : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_depend> {
    std::string owner;       // executable:<path> | module:<id> | package:<pkg>/<mod>
    std::string dependency;  // stray:<id>=<path> | module:<source> | package:<pkg>/<mod>
    bool remove{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_depend(cfg cfg, std::optional<std::filesystem::path> const &cli_registry);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_registry_;
};

}  // namespace knapsac
