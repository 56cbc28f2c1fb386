#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace knapsac {

struct process_result {
  int exit_code;
  std::optional<int> signal;
};

enum class process_stream { std_out, std_err };

struct process_run_cfg {
  std::function<void(process_stream, std::string_view)> on_output_line;
  std::optional<std::filesystem::path> cwd;
};

// Spawns argv[0] (resolved through PATH) with the remaining arguments, streaming its
// output line by line. stdin is /dev/null. A failed exec reports exit code 127.
// Throws std::invalid_argument on empty argv, std::system_error on pipe/fork failure.
process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg);

}  // namespace knapsac
