#include "platform.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <system_error>

namespace knapsac::platform {

struct file_lock::impl {
  int fd;
};

// Releases the descriptor only; the lock file stays on disk for the next holder.
file_lock::~file_lock() {
  if (impl_) { ::close(impl_->fd); }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

file_lock::file_lock(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR, 0666) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{ .l_type = F_WRLCK,
                   .l_whence = SEEK_SET,
                   .l_start = 0,
                   .l_len = 0,
                   .l_pid = 0 };

  for (;;) {
    if (::fcntl(fd, F_SETLKW, &fl) != -1) { break; }
    if (errno == EINTR) { continue; }
    int const err{ errno };
    ::close(fd);
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  impl_ = std::make_unique<impl>();
  impl_->fd = fd;
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

std::optional<std::filesystem::path> get_home_dir() {
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home };
  }
  return std::nullopt;
}

}  // namespace knapsac::platform
