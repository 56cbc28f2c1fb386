#if defined(_WIN32)
#error "process_posix.cpp should not be compiled on Windows builds"
#else

#include "process.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace knapsac {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }

  fd_cleanup &operator=(fd_cleanup &&other) noexcept {
    if (this == &other) { return *this; }
    if (fd_ != -1) { close_with_retry(); }
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
  }

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

struct pipe_state {
  fd_cleanup read_fd;
  process_stream stream;
  std::string pending;
  bool closed;
};

void deliver(pipe_state const &pipe, std::string_view line, process_run_cfg const &cfg) {
  if (cfg.on_output_line) { cfg.on_output_line(pipe.stream, line); }
}

void stream_pipes(std::array<pipe_state, 2> &pipes, process_run_cfg const &cfg) {
  std::array<pollfd, 2> poll_fds{};
  std::string chunk(4096, '\0');
  size_t closed_count{ 0 };

  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    poll_fds[i].fd = pipes[i].read_fd.get();
    poll_fds[i].events = POLLIN;
  }

  while (closed_count < pipes.size()) {
    int const poll_result{ ::poll(poll_fds.data(), poll_fds.size(), -1) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }

    for (size_t i{ 0 }; i < pipes.size(); ++i) {
      auto &pipe{ pipes[i] };
      if (pipe.closed) { continue; }

      short const revents{ poll_fds[i].revents };
      if (revents == 0) { continue; }
      if (revents & (POLLERR | POLLNVAL)) {
        throw std::runtime_error("poll failed on child pipe");
      }

      ssize_t const read_bytes{ ::read(pipe.read_fd.get(), chunk.data(), chunk.size()) };
      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }

      if (read_bytes == 0) {
        if (!pipe.pending.empty()) {
          deliver(pipe, pipe.pending, cfg);
          pipe.pending.clear();
        }
        pipe.closed = true;
        ++closed_count;
        poll_fds[i].fd = -1;
        poll_fds[i].events = 0;
        continue;
      }

      pipe.pending.append(chunk.data(), static_cast<size_t>(read_bytes));

      size_t newline{ 0 };
      while ((newline = pipe.pending.find('\n')) != std::string::npos) {
        deliver(pipe, std::string_view{ pipe.pending }.substr(0, newline), cfg);
        pipe.pending.erase(0, newline + 1);
      }
    }
  }
}

process_result wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result{ ::waitpid(child, &status, 0) };
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }

  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

[[noreturn]] void exec_child_process(fd_cleanup &stdout_read,
                                     fd_cleanup &stdout_write,
                                     fd_cleanup &stderr_read,
                                     fd_cleanup &stderr_write,
                                     std::optional<std::filesystem::path> const &cwd,
                                     std::vector<char *> const &argv) {
  stdout_read.release();
  stderr_read.release();

  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1) {
    std::perror("open /dev/null");
    _exit(kChildErrorExit);
  }

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ stdout_write.get(), STDOUT_FILENO },
    std::pair{ stderr_write.get(), STDERR_FILENO },
  };

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }

  if (null_fd != STDIN_FILENO) { ::close(null_fd); }
  stdout_write.release();
  stderr_write.release();

  if (cwd && ::chdir(cwd->c_str()) == -1) {
    std::perror("chdir");
    _exit(kChildErrorExit);
  }

  ::execvp(argv[0], argv.data());
  std::perror("execvp");
  _exit(kChildErrorExit);
}

}  // namespace

process_result process_run(std::vector<std::string> const &argv_strings,
                           process_run_cfg const &cfg) {
  if (argv_strings.empty()) {
    throw std::invalid_argument("process_run: argv must be non-empty");
  }

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  int stdout_pipefd[2];
  if (::pipe(stdout_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stdout_read_end{ stdout_pipefd[0] };
  fd_cleanup stdout_write_end{ stdout_pipefd[1] };

  int stderr_pipefd[2];
  if (::pipe(stderr_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stderr_read_end{ stderr_pipefd[0] };
  fd_cleanup stderr_write_end{ stderr_pipefd[1] };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {
    exec_child_process(stdout_read_end,
                       stdout_write_end,
                       stderr_read_end,
                       stderr_write_end,
                       cfg.cwd,
                       argv);
  }

  stdout_write_end.release();
  stderr_write_end.release();

  process_result result{};
  try {
    std::array<pipe_state, 2> pipes{
      pipe_state{ std::move(stdout_read_end), process_stream::std_out, {}, false },
      pipe_state{ std::move(stderr_read_end), process_stream::std_err, {}, false },
    };

    stream_pipes(pipes, cfg);
    result = wait_for_child(child);
  } catch (...) {
    ::kill(child, SIGKILL);
    wait_for_child(child);
    throw;
  }

  return result;
}

}  // namespace knapsac

#endif
