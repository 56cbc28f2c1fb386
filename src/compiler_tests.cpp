#include "compiler.h"

#include "registry_error.h"
#include "test_support.h"

#include <doctest/doctest.h>

namespace knapsac {

TEST_CASE("process_compiler: runs command with source and output") {
  test::temp_dir tmp{ "compiler" };
  auto const source{ tmp.write_file("a.sac", "module a\n") };
  auto const output{ tmp.path() / "a.out" };

  process_compiler cc;
  int const rc{ cc.compile({ .language = { .compiler_command = "cp", .output_option = "" },
                             .source = source,
                             .output = output }) };

  CHECK(rc == 0);
  CHECK(util_load_file(output) == "module a\n");
}

TEST_CASE("process_compiler: non-zero exit is reported, not thrown") {
  test::temp_dir tmp{ "compiler" };
  process_compiler cc;
  int const rc{ cc.compile({ .language = { .compiler_command = "false",
                                           .output_option = "-o" },
                             .source = tmp.path() / "a.sac",
                             .output = tmp.path() / "a.out" }) };
  CHECK(rc != 0);
}

TEST_CASE("process_compiler: empty command is a build failure") {
  process_compiler cc;
  CHECK(test::error_code_of([&] {
          cc.compile({ .language = {}, .source = "/a.sac", .output = "/a.out" });
        }) == registry_errc::build_failed);
}

}  // namespace knapsac
