#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace knapsac {

class cmd_add_module : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_add_module> {
    std::filesystem::path source;
    std::string identifier;
    std::filesystem::path output_location;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_add_module(cfg cfg, std::optional<std::filesystem::path> const &cli_registry);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_registry_;
};

}  // namespace knapsac
