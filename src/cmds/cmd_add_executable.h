#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace knapsac {

class cmd_add_executable : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_add_executable> {
    std::filesystem::path source;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_add_executable(cfg cfg, std::optional<std::filesystem::path> const &cli_registry);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_registry_;
};

}  // namespace knapsac
