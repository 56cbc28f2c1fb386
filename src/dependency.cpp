#include "dependency.h"

#include "util.h"

#include <stdexcept>

namespace knapsac {

bool dependency_is_package_reference(dependency const &dep) {
  return std::holds_alternative<package_dependency>(dep);
}

std::string dependency_to_string(dependency const &dep) {
  return std::visit(match{
                        [](stray_dependency const &d) {
                          return "stray:" + d.identifier + "=" + d.output_location.string();
                        },
                        [](standalone_dependency const &d) {
                          return "module:" + d.source.string();
                        },
                        [](package_dependency const &d) {
                          return "package:" + d.package + "/" + d.module;
                        },
                    },
                    dep);
}

dependency dependency_parse(std::string_view text) {
  auto const colon{ text.find(':') };
  if (colon == std::string_view::npos) {
    throw std::runtime_error("dependency '" + std::string{ text } +
                             "' must be stray:<id>=<path>, module:<source> or "
                             "package:<package>/<module>");
  }

  std::string_view const kind{ text.substr(0, colon) };
  std::string_view const body{ text.substr(colon + 1) };

  if (kind == "stray") {
    auto const eq{ body.find('=') };
    if (eq == std::string_view::npos || eq == 0 || eq + 1 == body.size()) {
      throw std::runtime_error("stray dependency must be stray:<id>=<path>: " +
                               std::string{ text });
    }
    return stray_dependency{ std::string{ body.substr(0, eq) },
                             std::filesystem::path{ body.substr(eq + 1) } };
  }

  if (kind == "module") {
    if (body.empty()) {
      throw std::runtime_error("module dependency must name a source path: " +
                               std::string{ text });
    }
    return standalone_dependency{ std::filesystem::path{ body } };
  }

  if (kind == "package") {
    auto const slash{ body.find('/') };
    if (slash == std::string_view::npos || slash == 0 || slash + 1 == body.size() ||
        body.find('/', slash + 1) != std::string_view::npos) {
      throw std::runtime_error("package dependency must be package:<package>/<module>: " +
                               std::string{ text });
    }
    return package_dependency{ std::string{ body.substr(0, slash) },
                               std::string{ body.substr(slash + 1) } };
  }

  throw std::runtime_error("unknown dependency kind '" + std::string{ kind } + "'");
}

}  // namespace knapsac
