#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace knapsac::platform {

// Exclusive advisory lock on `path` (created if missing). Blocks until acquired.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// $HOME, or nullopt if unset.
std::optional<std::filesystem::path> get_home_dir();

}  // namespace knapsac::platform
