#include "test_support.h"
#include "tui.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(knapsac::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(knapsac::tui::set_output_handler(handler));
  CHECK_NOTHROW(knapsac::tui::run(knapsac::tui::level::TUI_INFO));
  CHECK_NOTHROW(knapsac::tui::shutdown());

  CHECK_NOTHROW(knapsac::tui::run(std::nullopt));
  CHECK_THROWS_AS(knapsac::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(knapsac::tui::run(std::nullopt), std::logic_error);
  CHECK_THROWS_AS(knapsac::tui::configure_trace_outputs({}), std::logic_error);

  CHECK_NOTHROW(knapsac::tui::shutdown());
  CHECK_THROWS_AS(knapsac::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(knapsac::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    knapsac::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      knapsac::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

bool contains(std::string const &haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

std::vector<std::string> read_lines(std::filesystem::path const &path) {
  std::ifstream file{ path };
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty()) { lines.push_back(line); }
  }
  return lines;
}

void expect_json_tokens(knapsac::trace_event_t const &event,
                        std::vector<std::string> tokens) {
  auto const json{ knapsac::trace_event_to_json(event) };
  CHECK_MESSAGE(contains(json, "\"ts\""), "missing timestamp in json");
  tokens.emplace_back(std::string{ "\"event\":\"" } +
                      std::string(knapsac::trace_event_name(event)) + "\"");
  for (auto const &token : tokens) {
    CHECK_MESSAGE(contains(json, token), "missing token: " << token << " in json: " << json);
  }
}

}  // namespace

TEST_CASE("trace_output_parse: stderr and file outputs") {
  auto const err{ knapsac::tui::trace_output_parse("stderr") };
  REQUIRE(err.has_value());
  CHECK(err->type == knapsac::tui::trace_output_type::std_err);
  CHECK_FALSE(err->file_path.has_value());

  auto const file{ knapsac::tui::trace_output_parse("file:/tmp/t.jsonl") };
  REQUIRE(file.has_value());
  CHECK(file->type == knapsac::tui::trace_output_type::file);
  CHECK(file->file_path == std::filesystem::path{ "/tmp/t.jsonl" });

  CHECK_FALSE(knapsac::tui::trace_output_parse("file:").has_value());
  CHECK_FALSE(knapsac::tui::trace_output_parse("syslog").has_value());
  CHECK_FALSE(knapsac::tui::trace_output_parse("").has_value());
}

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(knapsac::tui::run(std::nullopt));

  knapsac::tui::debug("hello %s", "world");
  knapsac::tui::info("value %d", 42);
  knapsac::tui::warn("three %d", 3);
  knapsac::tui::error("boom");

  CHECK_NOTHROW(knapsac::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(knapsac::tui::run(knapsac::tui::level::TUI_DEBUG, true));
  knapsac::tui::info("structured %d", 7);
  CHECK_NOTHROW(knapsac::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(contains(line, "[INF"));
  CHECK(line.rfind("structured 7\n") == line.size() - std::string("structured 7\n").size());
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(knapsac::tui::run(knapsac::tui::level::TUI_WARN, true));
  knapsac::tui::debug("debug");
  knapsac::tui::info("info");
  knapsac::tui::warn("warn");
  knapsac::tui::error("error");
  CHECK_NOTHROW(knapsac::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(contains(messages[0], "WRN"));
  CHECK(contains(messages[0], "warn"));
  CHECK(contains(messages[1], "ERR"));
  CHECK(contains(messages[1], "error"));

  messages.clear();
  CHECK_NOTHROW(knapsac::tui::run(knapsac::tui::level::TUI_INFO, true));
  knapsac::tui::debug("debug");
  knapsac::tui::info("info");
  CHECK_NOTHROW(knapsac::tui::shutdown());
  REQUIRE(messages.size() == 1);
  CHECK(contains(messages[0], "INF"));
  CHECK(contains(messages[0], "info"));
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  knapsac::tui::configure_trace_outputs(
      { { knapsac::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(knapsac::tui::run(knapsac::tui::level::TUI_TRACE, false));

  knapsac::tui::trace(knapsac::trace_events::dependency_added{
      .owner = "app",
      .identifier = "a",
      .dependency = "Module: b",
  });

  CHECK_NOTHROW(knapsac::tui::shutdown());
  REQUIRE_FALSE(messages.empty());
  CHECK(contains(messages[0], "dependency_added"));
  CHECK(contains(messages[0], "owner=app"));
  CHECK(contains(messages[0], "dependency=Module: b"));

  knapsac::tui::configure_trace_outputs({});
}

TEST_CASE_FIXTURE(captured_output, "tui trace without outputs emits nothing") {
  knapsac::tui::configure_trace_outputs({});
  CHECK_FALSE(knapsac::tui::g_trace_enabled);

  CHECK_NOTHROW(knapsac::tui::run(knapsac::tui::level::TUI_TRACE, false));
  KNAPSAC_TRACE_EMIT((knapsac::trace_events::unit_added{ .unit = "Module: a" }));
  knapsac::tui::trace(knapsac::trace_events::unit_added{ .unit = "Module: b" });
  CHECK_NOTHROW(knapsac::tui::shutdown());

  CHECK(messages.empty());
}

TEST_CASE("trace_event_to_json serializes all event types") {
  expect_json_tokens(knapsac::trace_events::unit_added{ .unit = "Module: a" },
                     { "\"unit\":\"Module: a\"" });

  expect_json_tokens(
      knapsac::trace_events::unit_removed{ .unit = "Module: a", .cascaded_edges = 3 },
      { "\"unit\":\"Module: a\"", "\"cascaded_edges\":3" });

  expect_json_tokens(
      knapsac::trace_events::dependency_added{
          .owner = "app",
          .identifier = "a",
          .dependency = "Module: b",
      },
      { "\"owner\":\"app\"", "\"identifier\":\"a\"", "\"dependency\":\"Module: b\"" });

  expect_json_tokens(
      knapsac::trace_events::dependency_removed{
          .owner = "app",
          .identifier = "a",
          .dependency = "Module: b",
          .cascade = true,
      },
      { "\"owner\":\"app\"", "\"dependency\":\"Module: b\"", "\"cascade\":true" });

  expect_json_tokens(
      knapsac::trace_events::dependency_rewritten{
          .owner = "app",
          .identifier = "a",
          .from = "Module: b",
          .to = "Package: lib, Module: b",
      },
      { "\"from\":\"Module: b\"", "\"to\":\"Package: lib, Module: b\"" });

  expect_json_tokens(knapsac::trace_events::cycle_rejected{ .owner = "a", .target = "b" },
                     { "\"owner\":\"a\"", "\"target\":\"b\"" });

  expect_json_tokens(
      knapsac::trace_events::package_promoted{
          .package = "lib",
          .root = "/work/lib",
          .module_count = 2,
      },
      { "\"package\":\"lib\"", "\"root\":\"/work/lib\"", "\"module_count\":2" });

  expect_json_tokens(
      knapsac::trace_events::registry_saved{
          .location = "/home/u/knapsac_registry.json",
          .modules = 4,
          .executables = 1,
          .packages = 0,
      },
      { "\"location\":\"/home/u/knapsac_registry.json\"",
        "\"modules\":4",
        "\"executables\":1",
        "\"packages\":0" });

  expect_json_tokens(
      knapsac::trace_events::compiler_invoked{
          .package = "lib",
          .module = "a",
          .exit_code = 1,
          .duration_ms = 55,
      },
      { "\"package\":\"lib\"", "\"module\":\"a\"", "\"exit_code\":1", "\"duration_ms\":55" });

  expect_json_tokens(
      knapsac::trace_events::vcs_step{
          .repository = "/work/lib",
          .step = "tag",
          .detail = "1.0.0",
      },
      { "\"repository\":\"/work/lib\"", "\"step\":\"tag\"", "\"detail\":\"1.0.0\"" });
}

TEST_CASE("trace_event_to_string formats human-readable output") {
  auto output{ knapsac::trace_event_to_string(knapsac::trace_events::dependency_removed{
      .owner = "app",
      .identifier = "a",
      .dependency = "Module: b",
      .cascade = false,
  }) };
  CHECK(output.rfind("dependency_removed", 0) == 0);
  CHECK(contains(output, "owner=app"));
  CHECK(contains(output, "identifier=a"));
  CHECK(contains(output, "dependency=Module: b"));
  CHECK(contains(output, "cascade=false"));

  output = knapsac::trace_event_to_string(knapsac::trace_events::compiler_invoked{
      .package = "lib",
      .module = "a",
      .exit_code = 0,
      .duration_ms = 12,
  });
  CHECK(output ==
        "compiler_invoked package=lib module=a exit_code=0 duration_ms=12");

  output = knapsac::trace_event_to_string(
      knapsac::trace_events::unit_removed{ .unit = "Executable: app", .cascaded_edges = 0 });
  CHECK(output == "unit_removed unit=Executable: app cascaded_edges=0");
}

TEST_CASE("trace file output writes JSONL format") {
  knapsac::test::temp_dir const tmp{ "trace_file" };
  auto const trace_path{ tmp.path() / "trace.jsonl" };

  knapsac::tui::configure_trace_outputs(
      { { knapsac::tui::trace_output_type::file, trace_path } });
  CHECK_NOTHROW(knapsac::tui::run(knapsac::tui::level::TUI_TRACE, false));

  KNAPSAC_TRACE_EMIT((knapsac::trace_events::unit_added{ .unit = "Module: a" }));
  KNAPSAC_TRACE_EMIT((knapsac::trace_events::cycle_rejected{ .owner = "a", .target = "b" }));

  CHECK_NOTHROW(knapsac::tui::shutdown());

  auto const lines{ read_lines(trace_path) };
  REQUIRE(lines.size() == 2);
  for (auto const &line : lines) {
    CHECK(line.front() == '{');
    CHECK(line.back() == '}');
    CHECK(contains(line, "\"ts\":"));
  }
  CHECK(contains(lines[0], "\"event\":\"unit_added\""));
  CHECK(contains(lines[1], "\"event\":\"cycle_rejected\""));
  CHECK(contains(lines[1], "\"target\":\"b\""));

  knapsac::tui::configure_trace_outputs({});
}

TEST_CASE_FIXTURE(captured_output, "trace multiple outputs simultaneously") {
  knapsac::test::temp_dir const tmp{ "trace_multi" };
  auto const trace_path{ tmp.path() / "trace.jsonl" };

  knapsac::tui::configure_trace_outputs(
      { { knapsac::tui::trace_output_type::std_err, std::nullopt },
        { knapsac::tui::trace_output_type::file, trace_path } });
  CHECK_NOTHROW(knapsac::tui::run(knapsac::tui::level::TUI_TRACE, false));

  knapsac::tui::trace(knapsac::trace_events::registry_saved{
      .location = "memory",
      .modules = 2,
      .executables = 1,
      .packages = 0,
  });

  CHECK_NOTHROW(knapsac::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(contains(messages[0], "registry_saved location=memory"));

  auto const lines{ read_lines(trace_path) };
  REQUIRE(lines.size() == 1);
  CHECK(contains(lines[0], "\"event\":\"registry_saved\""));
  CHECK(contains(lines[0], "\"modules\":2"));

  knapsac::tui::configure_trace_outputs({});
}

TEST_CASE("configure_trace_outputs rejects multiple file outputs") {
  knapsac::test::temp_dir const tmp{ "trace_two_files" };

  CHECK_THROWS_AS(knapsac::tui::configure_trace_outputs(
                      { { knapsac::tui::trace_output_type::file, tmp.path() / "1.jsonl" },
                        { knapsac::tui::trace_output_type::file, tmp.path() / "2.jsonl" } }),
                  std::logic_error);

  knapsac::tui::configure_trace_outputs({});
}

TEST_CASE("configure_trace_outputs reports unopenable trace files") {
  knapsac::test::temp_dir const tmp{ "trace_bad_path" };

  CHECK_THROWS_AS(
      knapsac::tui::configure_trace_outputs(
          { { knapsac::tui::trace_output_type::file, tmp.path() / "missing" / "t.jsonl" } }),
      std::runtime_error);

  knapsac::tui::configure_trace_outputs({});
}
