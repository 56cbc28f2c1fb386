#include "compiler.h"

#include "process.h"
#include "registry_error.h"
#include "tui.h"

#include <string>
#include <system_error>
#include <vector>

namespace knapsac {

int process_compiler::compile(compile_request const &request) {
  if (request.language.compiler_command.empty()) {
    throw registry_error{ registry_errc::build_failed,
                          "no compiler command configured for " +
                              request.source.string() };
  }

  std::vector<std::string> argv{ request.language.compiler_command,
                                 request.source.string() };
  if (!request.language.output_option.empty()) {
    argv.push_back(request.language.output_option);
  }
  argv.push_back(request.output.string());

  tui::debug("compile: %s %s %s %s",
             request.language.compiler_command.c_str(),
             request.source.string().c_str(),
             request.language.output_option.c_str(),
             request.output.string().c_str());

  process_run_cfg cfg;
  cfg.on_output_line = [](process_stream stream, std::string_view line) {
    std::string const text{ line };
    if (stream == process_stream::std_err) {
      tui::debug("[compiler stderr] %s", text.c_str());
    } else {
      tui::debug("[compiler] %s", text.c_str());
    }
  };

  try {
    return process_run(argv, cfg).exit_code;
  } catch (std::system_error const &e) {
    throw registry_error{ registry_errc::build_failed,
                          "failed to start " + request.language.compiler_command + ": " +
                              e.what() };
  }
}

}  // namespace knapsac
