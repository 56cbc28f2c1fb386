#include "store.h"

#include "registry_error.h"
#include "registry_json.h"
#include "test_support.h"

#include <doctest/doctest.h>

#include <cstdlib>

namespace knapsac {

namespace {

registry_snapshot one_module_snapshot() {
  registry_snapshot s;
  s.modules.emplace("a", standalone_module{ "a", "/src/a.sac", "/out/a" });
  return s;
}

}  // namespace

TEST_CASE("file_store::load: missing file is an empty registry") {
  test::temp_dir tmp{ "store" };
  file_store store{ tmp.path() / "registry.json" };
  CHECK(store.load() == registry_snapshot{});
}

TEST_CASE("file_store::save then load") {
  test::temp_dir tmp{ "store" };
  auto const path{ tmp.path() / "nested" / "registry.json" };
  file_store store{ path };

  store.save(one_module_snapshot());

  CHECK(std::filesystem::is_regular_file(path));
  CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));
  CHECK(file_store{ path }.load() == one_module_snapshot());
}

TEST_CASE("file_store::save: full overwrite") {
  test::temp_dir tmp{ "store" };
  file_store store{ tmp.path() / "registry.json" };

  store.save(one_module_snapshot());
  store.save({});
  CHECK(store.load() == registry_snapshot{});
}

TEST_CASE("file_store::load: malformed file is invalid_registry") {
  test::temp_dir tmp{ "store" };
  auto const path{ tmp.write_file("registry.json", "{ \"modules\": ") };
  file_store store{ path };
  CHECK(test::error_code_of([&] { store.load(); }) == registry_errc::invalid_registry);
}

TEST_CASE("file_store::save: path validation") {
  test::temp_dir tmp{ "store" };
  auto const save_to{ [](std::filesystem::path p) {
    return test::error_code_of([p] { file_store{ p }.save({}); });
  } };

  CHECK(save_to("relative/registry.json") == registry_errc::registry_path_not_absolute);
  CHECK(save_to(tmp.path() / "registry.txt") == registry_errc::registry_path_not_json);
  CHECK(save_to(tmp.path() / "registry") == registry_errc::registry_path_not_file);
  CHECK(save_to(tmp.make_dir("dir.json")) == registry_errc::registry_path_not_file);
  CHECK_FALSE(std::filesystem::exists(tmp.path() / "registry.txt"));
}

TEST_CASE("file_store: manifest save and load") {
  test::temp_dir tmp{ "store" };
  auto const root{ tmp.make_dir("P") };
  file_store store{ tmp.path() / "registry.json" };

  CHECK_FALSE(store.load_manifest(root).has_value());

  package p;
  p.identifier = "P";
  p.root = root;
  p.add_module("a.sac", package_module{ "a", "a/output" });
  store.save_manifest(root, p.manifest());

  CHECK(std::filesystem::is_regular_file(root / kManifestFileName));
  auto const loaded{ store.load_manifest(root) };
  REQUIRE(loaded.has_value());
  CHECK(*loaded == p.manifest());
}

TEST_CASE("file_store: unreadable manifest is invalid_registry") {
  test::temp_dir tmp{ "store" };
  auto const root{ tmp.make_dir("P") };
  tmp.write_file("P/manifest.json", "not json");
  file_store store{ tmp.path() / "registry.json" };
  CHECK(test::error_code_of([&] { store.load_manifest(root); }) ==
        registry_errc::invalid_registry);
}

TEST_CASE("file_store::lock: creates the lock file beside the registry") {
  test::temp_dir tmp{ "store" };
  file_store store{ tmp.path() / "registry.json" };
  {
    auto lock{ store.lock() };
    CHECK(std::filesystem::exists(tmp.path() / "registry.json.lock"));
  }
}

TEST_CASE("memory_store: counts saves and keeps the document") {
  memory_store store;
  CHECK(store.load() == registry_snapshot{});

  store.save(one_module_snapshot());
  CHECK(store.save_count() == 1);
  CHECK(store.document() == registry_to_json(one_module_snapshot()));
  CHECK(store.load() == one_module_snapshot());

  store.save_manifest("/work/P", package_manifest{ .identifier = "P" });
  CHECK(store.manifest_save_count() == 1);
  REQUIRE(store.load_manifest("/work/P").has_value());
  CHECK(store.load_manifest("/work/P")->identifier == "P");
  CHECK_FALSE(store.load_manifest("/work/Q").has_value());
}

TEST_CASE("resolve_registry_path: explicit path wins") {
  CHECK(resolve_registry_path(std::filesystem::path{ "/tmp/r.json" }) == "/tmp/r.json");
}

TEST_CASE("resolve_registry_path: environment then home") {
  char const *saved_env{ std::getenv("KNAPSAC_REGISTRY") };
  std::string const saved{ saved_env ? saved_env : "" };

  ::setenv("KNAPSAC_REGISTRY", "/env/registry.json", 1);
  CHECK(resolve_registry_path(std::nullopt) == "/env/registry.json");

  ::unsetenv("KNAPSAC_REGISTRY");
  if (auto const home{ platform::get_home_dir() }) {
    CHECK(resolve_registry_path(std::nullopt) == *home / "knapsac_registry.json");
  }

  if (saved_env) { ::setenv("KNAPSAC_REGISTRY", saved.c_str(), 1); }
}

}  // namespace knapsac
