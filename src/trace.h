#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace knapsac {

namespace trace_events {

struct unit_added {
  std::string unit;
};

struct unit_removed {
  std::string unit;
  std::size_t cascaded_edges;
};

struct dependency_added {
  std::string owner;
  std::string identifier;
  std::string dependency;
};

struct dependency_removed {
  std::string owner;
  std::string identifier;
  std::string dependency;
  bool cascade;
};

struct dependency_rewritten {
  std::string owner;
  std::string identifier;
  std::string from;
  std::string to;
};

struct cycle_rejected {
  std::string owner;
  std::string target;
};

struct package_promoted {
  std::string package;
  std::string root;
  std::size_t module_count;
};

struct registry_saved {
  std::string location;
  std::size_t modules;
  std::size_t executables;
  std::size_t packages;
};

struct compiler_invoked {
  std::string package;
  std::string module;
  int exit_code;
  std::int64_t duration_ms;
};

struct vcs_step {
  std::string repository;
  std::string step;
  std::string detail;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::unit_added,
                                   trace_events::unit_removed,
                                   trace_events::dependency_added,
                                   trace_events::dependency_removed,
                                   trace_events::dependency_rewritten,
                                   trace_events::cycle_rejected,
                                   trace_events::package_promoted,
                                   trace_events::registry_saved,
                                   trace_events::compiler_invoked,
                                   trace_events::vcs_step>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);
}  // namespace tui

}  // namespace knapsac

#if defined(__clang__) || defined(__GNUC__)
#define KNAPSAC_TRACE_UNLIKELY [[unlikely]]
#else
#define KNAPSAC_TRACE_UNLIKELY
#endif

#define KNAPSAC_TRACE_EMIT(event_expr) \
  do { \
    if (::knapsac::tui::g_trace_enabled) KNAPSAC_TRACE_UNLIKELY { \
        ::knapsac::tui::trace event_expr; \
      } \
  } while (0)
