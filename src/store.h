#pragma once

#include "build_unit.h"
#include "package.h"
#include "platform.h"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace knapsac {

using module_map = std::map<std::string, standalone_module, std::less<>>;
using executable_map = std::map<std::filesystem::path, executable>;
using package_map = std::map<std::string, package, std::less<>>;

// Complete in-memory state of a registry; what a store persists.
struct registry_snapshot {
  module_map modules;
  executable_map executables;
  package_map packages;

  bool operator==(registry_snapshot const &) const = default;
};

// Persistence handle for the registry document and per-package manifests. Every save is
// a full overwrite.
class store {
 public:
  virtual ~store() = default;

  virtual registry_snapshot load() = 0;
  virtual void save(registry_snapshot const &snapshot) = 0;

  virtual void save_manifest(std::filesystem::path const &package_root,
                             package_manifest const &manifest) = 0;

  // nullopt if the package root has no manifest. Throws invalid_registry if one exists
  // but cannot be read.
  virtual std::optional<package_manifest> load_manifest(
      std::filesystem::path const &package_root) = 0;

  // Human-readable location for logs.
  virtual std::string describe() const = 0;
};

inline constexpr char kManifestFileName[]{ "manifest.json" };

// JSON registry file. Saves write `<path>.tmp` and rename it over `<path>`.
class file_store : public store {
 public:
  explicit file_store(std::filesystem::path path);

  // Missing file loads as an empty registry; malformed content throws invalid_registry.
  registry_snapshot load() override;

  // Throws registry_path_not_absolute, registry_path_not_file or registry_path_not_json
  // before touching the disk.
  void save(registry_snapshot const &snapshot) override;

  void save_manifest(std::filesystem::path const &package_root,
                     package_manifest const &manifest) override;
  std::optional<package_manifest> load_manifest(
      std::filesystem::path const &package_root) override;

  std::string describe() const override { return path_.string(); }

  // Exclusive lock on `<path>.lock`; hold it across load-mutate-save.
  platform::file_lock lock() const;

  std::filesystem::path const &path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// Keeps the serialized registry and manifests in memory. Tests use it to observe the
// write-through behavior without a filesystem.
class memory_store : public store {
 public:
  registry_snapshot load() override;
  void save(registry_snapshot const &snapshot) override;

  void save_manifest(std::filesystem::path const &package_root,
                     package_manifest const &manifest) override;
  std::optional<package_manifest> load_manifest(
      std::filesystem::path const &package_root) override;

  std::string describe() const override { return "<memory>"; }

  std::string const &document() const { return document_; }
  void set_document(std::string document) { document_ = std::move(document); }
  std::size_t save_count() const { return save_count_; }
  std::size_t manifest_save_count() const { return manifest_save_count_; }

 private:
  std::string document_;
  std::map<std::filesystem::path, std::string> manifests_;
  std::size_t save_count_{ 0 };
  std::size_t manifest_save_count_{ 0 };
};

// Resolution order: explicit path, $KNAPSAC_REGISTRY, $HOME/knapsac_registry.json.
// Throws std::runtime_error if none is available.
std::filesystem::path resolve_registry_path(
    std::optional<std::filesystem::path> const &explicit_path);

}  // namespace knapsac
