#include "trace.h"

#include "util.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace knapsac {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

}  // namespace

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::unit_added const &) -> std::string_view { return "unit_added"; },
          [](trace_events::unit_removed const &) -> std::string_view {
            return "unit_removed";
          },
          [](trace_events::dependency_added const &) -> std::string_view {
            return "dependency_added";
          },
          [](trace_events::dependency_removed const &) -> std::string_view {
            return "dependency_removed";
          },
          [](trace_events::dependency_rewritten const &) -> std::string_view {
            return "dependency_rewritten";
          },
          [](trace_events::cycle_rejected const &) -> std::string_view {
            return "cycle_rejected";
          },
          [](trace_events::package_promoted const &) -> std::string_view {
            return "package_promoted";
          },
          [](trace_events::registry_saved const &) -> std::string_view {
            return "registry_saved";
          },
          [](trace_events::compiler_invoked const &) -> std::string_view {
            return "compiler_invoked";
          },
          [](trace_events::vcs_step const &) -> std::string_view { return "vcs_step"; },
      },
      event);
}

std::string trace_event_to_string(trace_event_t const &event) {
  std::ostringstream oss;
  oss << trace_event_name(event);

  std::visit(match{
                 [&](trace_events::unit_added const &value) {
                   oss << " unit=" << value.unit;
                 },
                 [&](trace_events::unit_removed const &value) {
                   oss << " unit=" << value.unit
                       << " cascaded_edges=" << value.cascaded_edges;
                 },
                 [&](trace_events::dependency_added const &value) {
                   oss << " owner=" << value.owner << " identifier=" << value.identifier
                       << " dependency=" << value.dependency;
                 },
                 [&](trace_events::dependency_removed const &value) {
                   oss << " owner=" << value.owner << " identifier=" << value.identifier
                       << " dependency=" << value.dependency
                       << " cascade=" << bool_string(value.cascade);
                 },
                 [&](trace_events::dependency_rewritten const &value) {
                   oss << " owner=" << value.owner << " identifier=" << value.identifier
                       << " from=" << value.from << " to=" << value.to;
                 },
                 [&](trace_events::cycle_rejected const &value) {
                   oss << " owner=" << value.owner << " target=" << value.target;
                 },
                 [&](trace_events::package_promoted const &value) {
                   oss << " package=" << value.package << " root=" << value.root
                       << " module_count=" << value.module_count;
                 },
                 [&](trace_events::registry_saved const &value) {
                   oss << " location=" << value.location << " modules=" << value.modules
                       << " executables=" << value.executables
                       << " packages=" << value.packages;
                 },
                 [&](trace_events::compiler_invoked const &value) {
                   oss << " package=" << value.package << " module=" << value.module
                       << " exit_code=" << value.exit_code
                       << " duration_ms=" << value.duration_ms;
                 },
                 [&](trace_events::vcs_step const &value) {
                   oss << " repository=" << value.repository << " step=" << value.step
                       << " detail=" << value.detail;
                 },
             },
             event);

  return oss.str();
}

std::string trace_event_to_json(trace_event_t const &event) {
  nlohmann::ordered_json j;
  j["ts"] = format_timestamp(std::chrono::system_clock::now());
  j["event"] = std::string{ trace_event_name(event) };

  std::visit(match{
                 [&](trace_events::unit_added const &value) { j["unit"] = value.unit; },
                 [&](trace_events::unit_removed const &value) {
                   j["unit"] = value.unit;
                   j["cascaded_edges"] = value.cascaded_edges;
                 },
                 [&](trace_events::dependency_added const &value) {
                   j["owner"] = value.owner;
                   j["identifier"] = value.identifier;
                   j["dependency"] = value.dependency;
                 },
                 [&](trace_events::dependency_removed const &value) {
                   j["owner"] = value.owner;
                   j["identifier"] = value.identifier;
                   j["dependency"] = value.dependency;
                   j["cascade"] = value.cascade;
                 },
                 [&](trace_events::dependency_rewritten const &value) {
                   j["owner"] = value.owner;
                   j["identifier"] = value.identifier;
                   j["from"] = value.from;
                   j["to"] = value.to;
                 },
                 [&](trace_events::cycle_rejected const &value) {
                   j["owner"] = value.owner;
                   j["target"] = value.target;
                 },
                 [&](trace_events::package_promoted const &value) {
                   j["package"] = value.package;
                   j["root"] = value.root;
                   j["module_count"] = value.module_count;
                 },
                 [&](trace_events::registry_saved const &value) {
                   j["location"] = value.location;
                   j["modules"] = value.modules;
                   j["executables"] = value.executables;
                   j["packages"] = value.packages;
                 },
                 [&](trace_events::compiler_invoked const &value) {
                   j["package"] = value.package;
                   j["module"] = value.module;
                   j["exit_code"] = value.exit_code;
                   j["duration_ms"] = value.duration_ms;
                 },
                 [&](trace_events::vcs_step const &value) {
                   j["repository"] = value.repository;
                   j["step"] = value.step;
                   j["detail"] = value.detail;
                 },
             },
             event);

  return j.dump();
}

}  // namespace knapsac
