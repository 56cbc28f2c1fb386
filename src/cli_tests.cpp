#include "cli.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

knapsac::cli_args parse(std::vector<std::string> args) {
  args.insert(args.begin(), "knapsac");
  auto argv{ make_argv(args) };
  return knapsac::cli_parse(static_cast<int>(args.size()), argv.data());
}

template <typename cfg_t>
cfg_t const &require_cfg(knapsac::cli_args const &parsed) {
  REQUIRE(parsed.cmd_cfg.has_value());
  REQUIRE(std::holds_alternative<cfg_t>(*parsed.cmd_cfg));
  return std::get<cfg_t>(*parsed.cmd_cfg);
}

}  // namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({}) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: version") {
  SUBCASE("-v flag") { require_cfg<knapsac::cmd_version::cfg>(parse({ "-v" })); }
  SUBCASE("--version flag") { require_cfg<knapsac::cmd_version::cfg>(parse({ "--version" })); }
  SUBCASE("subcommand") { require_cfg<knapsac::cmd_version::cfg>(parse({ "version" })); }
}

TEST_CASE("cli_parse: --registry is global") {
  auto const parsed{ parse({ "--registry", "/tmp/reg.json", "list" }) };
  require_cfg<knapsac::cmd_list::cfg>(parsed);
  REQUIRE(parsed.registry_path.has_value());
  CHECK(*parsed.registry_path == "/tmp/reg.json");

  CHECK_FALSE(parse({ "list" }).registry_path.has_value());
}

TEST_CASE("cli_parse: list --json") {
  CHECK(require_cfg<knapsac::cmd_list::cfg>(parse({ "list", "--json" })).json);
  CHECK_FALSE(require_cfg<knapsac::cmd_list::cfg>(parse({ "list" })).json);
}

TEST_CASE("cli_parse: depend and undepend share a config") {
  auto const add{ parse({ "depend", "module:a", "package:P/b" }) };
  auto const &add_cfg{ require_cfg<knapsac::cmd_depend::cfg>(add) };
  CHECK(add_cfg.owner == "module:a");
  CHECK(add_cfg.dependency == "package:P/b");
  CHECK_FALSE(add_cfg.remove);

  auto const remove{ parse({ "undepend", "module:a", "package:P/b" }) };
  CHECK(require_cfg<knapsac::cmd_depend::cfg>(remove).remove);
}

TEST_CASE("cli_parse: remove") {
  auto const parsed{ parse({ "remove", "package:P" }) };
  CHECK(require_cfg<knapsac::cmd_remove::cfg>(parsed).unit == "package:P");
}

TEST_CASE("cli_parse: publish increment") {
  auto const parsed{ parse({ "publish", "P", "minor" }) };
  auto const &cfg{ require_cfg<knapsac::cmd_publish::cfg>(parsed) };
  CHECK(cfg.identifier == "P");
  CHECK(cfg.increment == "minor");

  CHECK(require_cfg<knapsac::cmd_publish::cfg>(parse({ "publish", "P" })).increment ==
        "patch");

  auto const bad{ parse({ "publish", "P", "huge" }) };
  CHECK_FALSE(bad.cmd_cfg.has_value());
  CHECK_FALSE(bad.cli_output.empty());
}

TEST_CASE("cli_parse: upload with and without remote") {
  auto const first{ parse({ "upload", "P", "https://example.com/P.git" }) };
  auto const &first_cfg{ require_cfg<knapsac::cmd_upload::cfg>(first) };
  REQUIRE(first_cfg.remote.has_value());
  CHECK(*first_cfg.remote == "https://example.com/P.git");

  auto const later{ parse({ "upload", "P" }) };
  CHECK_FALSE(require_cfg<knapsac::cmd_upload::cfg>(later).remote.has_value());
}

TEST_CASE("cli_parse: package options") {
  auto const root{ std::filesystem::temp_directory_path() };
  auto const parsed{ parse({ "package", "P", root.string(), "--compiler", "sacc" }) };
  auto const &cfg{ require_cfg<knapsac::cmd_package::cfg>(parsed) };
  CHECK(cfg.identifier == "P");
  CHECK(cfg.root == root);
  CHECK(cfg.compiler_command == "sacc");
  CHECK(cfg.output_option == "-o");
  CHECK_FALSE(cfg.build);

  auto const built{ parse({ "package", "P", root.string(), "--compiler", "sacc", "--build" }) };
  CHECK(require_cfg<knapsac::cmd_package::cfg>(built).build);

  CHECK_FALSE(parse({ "package", "P", root.string() }).cmd_cfg.has_value());
}

TEST_CASE("cli_parse: missing positional is a parse error") {
  auto const parsed{ parse({ "build" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: unknown subcommand") {
  auto const parsed{ parse({ "frobnicate" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: verbosity") {
  SUBCASE("default is info, undecorated") {
    auto const parsed{ parse({ "list" }) };
    CHECK(parsed.verbosity == knapsac::tui::level::TUI_INFO);
    CHECK_FALSE(parsed.decorated_logging);
  }

  SUBCASE("--verbose") {
    auto const parsed{ parse({ "--verbose", "list" }) };
    CHECK(parsed.verbosity == knapsac::tui::level::TUI_DEBUG);
    CHECK(parsed.decorated_logging);
  }
}

TEST_CASE("cli_parse: trace outputs") {
  SUBCASE("bare --trace goes to stderr") {
    auto const parsed{ parse({ "--trace" }) };
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == knapsac::tui::trace_output_type::std_err);
    CHECK(parsed.verbosity == knapsac::tui::level::TUI_TRACE);
  }

  SUBCASE("stderr and file") {
    auto const parsed{ parse({ "--trace", "stderr,file:/tmp/trace.jsonl", "list" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[0].type == knapsac::tui::trace_output_type::std_err);
    CHECK(parsed.trace_outputs[1].type == knapsac::tui::trace_output_type::file);
    CHECK(parsed.trace_outputs[1].file_path == std::filesystem::path{ "/tmp/trace.jsonl" });
  }

  SUBCASE("invalid spec drops the command") {
    auto const parsed{ parse({ "--trace", "syslog", "list" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output.find("syslog") != std::string::npos);
  }
}
