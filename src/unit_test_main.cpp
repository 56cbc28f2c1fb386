#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "libgit2_util.h"
#include "tui.h"

#include <string_view>

int main(int argc, char **argv) {
  doctest::Context context;
  context.applyCommandLine(argc, argv);

  knapsac::tui::init();
  knapsac::tui::set_output_handler([](std::string_view) {});
  knapsac::libgit2_scope git_guard;

  return context.run();
}
