#include "util.h"

#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace knapsac {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::string buffer(static_cast<size_t>(file_size), '\0');
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_file: failed to open file: " + path.string());
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::runtime_error("util_write_file: short write: " + path.string());
  }

  if (std::fflush(file.get()) != 0) {
    throw std::runtime_error("util_write_file: failed to flush: " + path.string());
  }
}

std::optional<std::filesystem::path> util_strip_prefix(std::filesystem::path const &root,
                                                       std::filesystem::path const &path) {
  auto const normal_root{ root.lexically_normal() };
  auto const normal_path{ path.lexically_normal() };

  auto root_it{ normal_root.begin() };
  auto path_it{ normal_path.begin() };

  while (root_it != normal_root.end()) {
    if (root_it->empty()) {  // trailing separator
      ++root_it;
      continue;
    }
    if (path_it == normal_path.end() || *path_it != *root_it) { return std::nullopt; }
    ++root_it;
    ++path_it;
  }

  std::filesystem::path rest;
  for (; path_it != normal_path.end(); ++path_it) {
    if (!path_it->empty()) { rest /= *path_it; }
  }
  return rest;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

std::filesystem::path scoped_path_cleanup::release() { return std::exchange(path_, {}); }

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace knapsac
