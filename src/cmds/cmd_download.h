#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace knapsac {

class cmd_download : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_download> {
    std::string url;
    std::optional<std::filesystem::path> destination;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_download(cfg cfg, std::optional<std::filesystem::path> const &cli_registry);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_registry_;
};

}  // namespace knapsac
