#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace knapsac {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  // Create command with the CLI registry override (for commands that open the registry)
  template <typename config>
  static ptr_t create(config const &cfg,
                      std::optional<std::filesystem::path> const &cli_registry);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg,
                       std::optional<std::filesystem::path> const &cli_registry) {
  return std::make_unique<typename config::cmd_t>(cfg, cli_registry);
}

}  // namespace knapsac
