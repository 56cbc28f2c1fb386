#include "cli.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace knapsac {

namespace {

// "stderr,file:/tmp/t.jsonl" -> { "stderr", "file:/tmp/t.jsonl" }
std::vector<std::string> split_trace_spec(std::string_view spec) {
  std::vector<std::string> tokens;
  while (!spec.empty()) {
    auto const pos{ spec.find(',') };
    auto const token{ spec.substr(0, pos) };
    if (!token.empty()) { tokens.emplace_back(token); }
    spec = (pos == std::string_view::npos) ? std::string_view{} : spec.substr(pos + 1);
  }
  return tokens;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "knapsac - module and package registry" };
  app.allow_windows_style_options(false);

  std::optional<std::filesystem::path> registry_path;
  app.add_option("--registry",
                 registry_path,
                 "Registry JSON file (overrides KNAPSAC_REGISTRY and "
                 "~/knapsac_registry.json)");

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  bool version_flag{ false };
  app.add_flag("-v,--version",
               version_flag,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_version::register_cli(app, on_selected);
  cmd_add_module::register_cli(app, on_selected);
  cmd_add_executable::register_cli(app, on_selected);
  cmd_mark::register_cli(app, on_selected);
  cmd_depend::register_cli(app, on_selected);
  cmd_remove::register_cli(app, on_selected);
  cmd_package::register_cli(app, on_selected);
  cmd_publish::register_cli(app, on_selected);
  cmd_upload::register_cli(app, on_selected);
  cmd_download::register_cli(app, on_selected);
  cmd_build::register_cli(app, on_selected);
  cmd_list::register_cli(app, on_selected);

  app.require_subcommand(0, 1);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  args.registry_path = registry_path;

  std::vector<std::string> trace_tokens;
  if (trace_option->count() > 0) {
    trace_tokens = split_trace_spec(trace_spec);
    if (trace_tokens.empty()) { trace_tokens.push_back("stderr"); }
  }

  if (!trace_tokens.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
    for (auto const &token : trace_tokens) {
      auto output{ tui::trace_output_parse(token) };
      if (!output) {
        args.cli_output = "Invalid trace output spec: " + token;
        args.trace_outputs.clear();
        cmd_cfg.reset();
        break;
      }
      args.trace_outputs.push_back(std::move(*output));
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace knapsac
