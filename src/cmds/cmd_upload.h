#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace knapsac {

class cmd_upload : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_upload> {
    std::string identifier;
    std::optional<std::string> remote;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_upload(cfg cfg, std::optional<std::filesystem::path> const &cli_registry);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_registry_;
};

}  // namespace knapsac
