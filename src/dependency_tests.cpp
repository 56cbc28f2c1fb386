#include "dependency.h"

#include <doctest/doctest.h>

#include <stdexcept>

namespace knapsac {

TEST_CASE("dependency_is_package_reference: only package edges") {
  CHECK(dependency_is_package_reference(package_dependency{ "P", "a" }));
  CHECK_FALSE(dependency_is_package_reference(standalone_dependency{ "/src/a.sac" }));
  CHECK_FALSE(dependency_is_package_reference(stray_dependency{ "x", "/out/x" }));
}

TEST_CASE("dependency: equality is per kind and payload") {
  dependency const a{ standalone_dependency{ "/src/a.sac" } };
  CHECK(a == dependency{ standalone_dependency{ "/src/a.sac" } });
  CHECK(a != dependency{ standalone_dependency{ "/src/b.sac" } });
  CHECK(dependency{ package_dependency{ "P", "a" } } !=
        dependency{ package_dependency{ "Q", "a" } });
  CHECK(dependency{ stray_dependency{ "a", "/out" } } !=
        dependency{ stray_dependency{ "a", "/elsewhere" } });
}

TEST_CASE("dependency_to_string: each kind") {
  CHECK(dependency_to_string(stray_dependency{ "zlib", "/opt/zlib" }) ==
        "stray:zlib=/opt/zlib");
  CHECK(dependency_to_string(standalone_dependency{ "/src/a.sac" }) == "module:/src/a.sac");
  CHECK(dependency_to_string(package_dependency{ "P", "a" }) == "package:P/a");
}

TEST_CASE("dependency_parse: accepted forms") {
  CHECK(dependency_parse("stray:zlib=/opt/zlib") ==
        dependency{ stray_dependency{ "zlib", "/opt/zlib" } });
  CHECK(dependency_parse("module:/src/a.sac") ==
        dependency{ standalone_dependency{ "/src/a.sac" } });
  CHECK(dependency_parse("package:P/a") == dependency{ package_dependency{ "P", "a" } });
}

TEST_CASE("dependency_parse: stray path may contain '='") {
  auto const dep{ dependency_parse("stray:x=/tmp/a=b") };
  REQUIRE(std::holds_alternative<stray_dependency>(dep));
  CHECK(std::get<stray_dependency>(dep).identifier == "x");
  CHECK(std::get<stray_dependency>(dep).output_location == "/tmp/a=b");
}

TEST_CASE("dependency_parse: malformed input throws") {
  CHECK_THROWS_AS(dependency_parse("zlib"), std::runtime_error);
  CHECK_THROWS_AS(dependency_parse("lib:zlib"), std::runtime_error);
  CHECK_THROWS_AS(dependency_parse("stray:zlib"), std::runtime_error);
  CHECK_THROWS_AS(dependency_parse("stray:=/opt"), std::runtime_error);
  CHECK_THROWS_AS(dependency_parse("module:"), std::runtime_error);
  CHECK_THROWS_AS(dependency_parse("package:P"), std::runtime_error);
  CHECK_THROWS_AS(dependency_parse("package:/a"), std::runtime_error);
  CHECK_THROWS_AS(dependency_parse("package:P/a/b"), std::runtime_error);
}

}  // namespace knapsac
