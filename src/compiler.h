#pragma once

#include <filesystem>
#include <string>

namespace knapsac {

// How a package's modules are compiled: `<compiler_command> <source> <output_option>
// <output>`.
struct language_cfg {
  std::string compiler_command;
  std::string output_option;

  bool operator==(language_cfg const &) const = default;
};

struct compile_request {
  language_cfg language;
  std::filesystem::path source;
  std::filesystem::path output;
};

class compiler {
 public:
  virtual ~compiler() = default;

  // Returns the compiler's exit code. Throws registry_error(build_failed) if the compiler
  // cannot be started at all.
  virtual int compile(compile_request const &request) = 0;
};

// Runs the configured compiler command as a child process; output goes to the debug log.
class process_compiler : public compiler {
 public:
  int compile(compile_request const &request) override;
};

}  // namespace knapsac
