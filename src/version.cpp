#include "version.h"

#include "util.h"

#include <semver.hpp>

#include <string_view>

namespace knapsac {

namespace {

std::string_view trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

std::string format_triple(std::uint64_t major, std::uint64_t minor, std::uint64_t patch) {
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

}  // namespace

version_t version_increment_apply(version_t const &current, version_increment kind) {
  return std::visit(
      match{
          [kind](not_versioned) -> version_t {
            switch (kind) {
              case version_increment::major: return semver_version{ 1, 0, 0 };
              case version_increment::minor: return semver_version{ 0, 1, 0 };
              case version_increment::patch: return semver_version{ 0, 0, 1 };
            }
            return semver_version{ 0, 0, 1 };
          },
          [kind](semver_version v) -> version_t {
            switch (kind) {
              case version_increment::major: ++v.major; break;
              case version_increment::minor: ++v.minor; break;
              case version_increment::patch: ++v.patch; break;
            }
            return v;
          },
      },
      current);
}

std::string version_to_string(version_t const &v) {
  return std::visit(match{
                        [](not_versioned) -> std::string { return "not_versioned"; },
                        [](semver_version const &s) -> std::string {
                          return format_triple(s.major, s.minor, s.patch);
                        },
                    },
                    v);
}

std::optional<version_t> version_parse(std::string_view text) {
  text = trim(text);
  if (text == "not_versioned") { return version_t{ not_versioned{} }; }

  semver::version<> parsed;
  if (!semver::parse(text, parsed)) { return std::nullopt; }

  semver_version const result{ static_cast<std::uint64_t>(parsed.major()),
                               static_cast<std::uint64_t>(parsed.minor()),
                               static_cast<std::uint64_t>(parsed.patch()) };

  // semver accepts pre-release/build suffixes; the registry only stores plain triples
  if (format_triple(result.major, result.minor, result.patch) != text) {
    return std::nullopt;
  }
  return version_t{ result };
}

std::optional<version_increment> version_increment_parse(std::string_view text) {
  if (text == "major") { return version_increment::major; }
  if (text == "minor") { return version_increment::minor; }
  if (text == "patch") { return version_increment::patch; }
  return std::nullopt;
}

}  // namespace knapsac
