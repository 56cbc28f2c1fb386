#pragma once

#include "cmds/cmd_add_executable.h"
#include "cmds/cmd_add_module.h"
#include "cmds/cmd_build.h"
#include "cmds/cmd_depend.h"
#include "cmds/cmd_download.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_mark.h"
#include "cmds/cmd_package.h"
#include "cmds/cmd_publish.h"
#include "cmds/cmd_remove.h"
#include "cmds/cmd_upload.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace knapsac {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_add_executable::cfg,
                                 cmd_add_module::cfg,
                                 cmd_build::cfg,
                                 cmd_depend::cfg,
                                 cmd_download::cfg,
                                 cmd_list::cfg,
                                 cmd_mark::cfg,
                                 cmd_package::cfg,
                                 cmd_publish::cfg,
                                 cmd_remove::cfg,
                                 cmd_upload::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> registry_path;  // Registry document override
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace knapsac
