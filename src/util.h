#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace knapsac {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as text.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_file(std::filesystem::path const &path);

// Write `content` to `path`, truncating any existing file.
// Throws std::runtime_error on open or short write.
void util_write_file(std::filesystem::path const &path, std::string_view content);

// Lexically strip `root` from `path`. Both are normalized first; a trailing separator on
// `root` is ignored. Returns nullopt if `path` is not under `root`.
// Example: ("/src/pkg", "/src/pkg/lib/a.sac") -> "lib/a.sac"
std::optional<std::filesystem::path> util_strip_prefix(std::filesystem::path const &root,
                                                       std::filesystem::path const &path);

// Removes `path` (recursively) on destruction; reset() swaps in a new path.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});

  // Keeps the path on disk; returns it and disarms the cleanup.
  std::filesystem::path release();
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace knapsac
