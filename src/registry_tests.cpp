#include "registry.h"

#include "registry_error.h"
#include "registry_json.h"
#include "test_support.h"

#include <doctest/doctest.h>

namespace knapsac {

namespace {

using test::error_code_of;

standalone_module make_module(std::string const &id) {
  return standalone_module{ id, "/src/" + id + ".sac", "/out/" + id };
}

standalone_dependency edge_to(std::string const &id) {
  return standalone_dependency{ "/src/" + id + ".sac" };
}

// Seeds a store with package P holding modules m and n (n -> m).
void seed_package(memory_store &store) {
  registry_snapshot s;
  package p;
  p.identifier = "P";
  p.root = "/work/P";
  p.add_module("m.sac", package_module{ "m", "m/output" });
  p.add_module("n.sac", package_module{ "n", "n/output" });
  p.get_module_mut("n")->add_dependency("m", package_dependency{ "P", "m" });
  s.packages.emplace("P", std::move(p));
  store.save(s);
}

}  // namespace

TEST_CASE("registry::add_module: inserts and persists") {
  memory_store store;
  registry reg{ store };

  reg.add_module(make_module("a"));

  CHECK(reg.has_module("a"));
  CHECK(reg.get_module_by_source("/src/a.sac") == reg.get_module("a"));
  CHECK(store.save_count() == 1);
  CHECK(registry_from_json(store.document()).modules.contains("a"));
}

TEST_CASE("registry::add_module: identifier and source collisions") {
  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));

  CHECK(error_code_of([&] { reg.add_module(make_module("a")); }) ==
        registry_errc::module_already_in_registry);
  CHECK(error_code_of([&] {
          reg.add_module(standalone_module{ "other", "/src/a.sac", "/out/other" });
        }) == registry_errc::module_already_in_registry);
  CHECK(store.save_count() == 1);
}

TEST_CASE("registry::add_module: carried edges are validated") {
  memory_store store;
  registry reg{ store };

  auto a{ make_module("a") };
  a.add_dependency("b", edge_to("b"));
  CHECK(error_code_of([&] { reg.add_module(a); }) ==
        registry_errc::referenced_unit_missing);
  CHECK_FALSE(reg.has_module("a"));
}

TEST_CASE("registry::add_executable: re-adding is a no-op") {
  memory_store store;
  registry reg{ store };

  reg.add_executable("/src/main.sac");
  reg.add_executable("/src/./main.sac");

  CHECK(reg.has_executable("/src/main.sac"));
  CHECK(reg.snapshot().executables.size() == 1);
  CHECK(store.save_count() == 1);
}

TEST_CASE("registry: module scenario a -> b, b -> a, remove b") {
  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_module(make_module("b"));

  reg.add_dependency(module_ref{ "a" }, "b", edge_to("b"));
  CHECK(reg.get_module("a")->has_dependency("b"));

  CHECK(error_code_of([&] { reg.add_dependency(module_ref{ "b" }, "a", edge_to("a")); }) ==
        registry_errc::cyclic_dependency);
  CHECK_FALSE(reg.get_module("b")->has_dependency("a"));

  reg.remove_module("b");
  CHECK_FALSE(reg.has_module("b"));
  CHECK(reg.get_module("a")->dependencies().empty());
}

TEST_CASE("registry::add_dependency: self edge is a cycle") {
  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));

  CHECK(error_code_of([&] { reg.add_dependency(module_ref{ "a" }, "a", edge_to("a")); }) ==
        registry_errc::cyclic_dependency);
}

TEST_CASE("registry::add_dependency: transitive cycle is rejected") {
  memory_store store;
  registry reg{ store };
  for (auto const *id : { "a", "b", "c", "d" }) { reg.add_module(make_module(id)); }

  reg.add_dependency(module_ref{ "a" }, "b", edge_to("b"));
  reg.add_dependency(module_ref{ "b" }, "c", edge_to("c"));
  reg.add_dependency(module_ref{ "c" }, "d", edge_to("d"));
  reg.add_dependency(module_ref{ "a" }, "c", edge_to("c"));  // diamond, not a cycle

  auto const saves{ store.save_count() };
  CHECK(error_code_of([&] { reg.add_dependency(module_ref{ "d" }, "a", edge_to("a")); }) ==
        registry_errc::cyclic_dependency);
  CHECK(store.save_count() == saves);
}

TEST_CASE("registry::add_dependency: identical edge is an idempotent no-op") {
  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_module(make_module("b"));

  reg.add_dependency(module_ref{ "a" }, "b", edge_to("b"));
  auto const saves{ store.save_count() };
  reg.add_dependency(module_ref{ "a" }, "b", edge_to("b"));

  CHECK(store.save_count() == saves);
  CHECK(reg.get_module("a")->dependencies().size() == 1);
}

TEST_CASE("registry::add_dependency: validation failures") {
  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_module(make_module("b"));

  SUBCASE("unknown owner") {
    CHECK(error_code_of([&] { reg.add_dependency(module_ref{ "zz" }, "b", edge_to("b")); }) ==
          registry_errc::referenced_unit_missing);
  }

  SUBCASE("unknown module target") {
    CHECK(error_code_of([&] { reg.add_dependency(module_ref{ "a" }, "c", edge_to("c")); }) ==
          registry_errc::referenced_unit_missing);
  }

  SUBCASE("unknown package target") {
    CHECK(error_code_of([&] {
            reg.add_dependency(module_ref{ "a" }, "m", package_dependency{ "P", "m" });
          }) == registry_errc::referenced_unit_missing);
  }

  SUBCASE("key does not name the target module") {
    CHECK(error_code_of([&] { reg.add_dependency(module_ref{ "a" }, "x", edge_to("b")); }) ==
          registry_errc::dependency_key_mismatch);
  }

  CHECK(reg.get_module("a")->dependencies().empty());
}

TEST_CASE("registry::add_dependency: stray edges are never validated") {
  memory_store store;
  registry reg{ store };
  reg.add_executable("/src/main.sac");

  reg.add_dependency(executable_ref{ "/src/main.sac" },
                     "zlib",
                     stray_dependency{ "zlib", "/nowhere/zlib" });
  CHECK(reg.get_executable("/src/main.sac")->has_dependency("zlib"));
}

TEST_CASE("registry::add_dependency: package module owners") {
  memory_store store;
  seed_package(store);
  registry reg{ store };
  reg.add_module(make_module("a"));

  CHECK(error_code_of([&] {
          reg.add_dependency(package_module_ref{ "P", "m" }, "a", edge_to("a"));
        }) == registry_errc::non_package_dependency);

  CHECK(error_code_of([&] {
          reg.add_dependency(package_module_ref{ "P", "m" },
                             "n",
                             package_dependency{ "P", "n" });
        }) == registry_errc::cyclic_dependency);

  auto const manifests{ store.manifest_save_count() };
  reg.add_dependency(package_module_ref{ "P", "m" },
                     "zlib",
                     stray_dependency{ "zlib", "/opt/zlib" });
  CHECK(reg.get_package_module("P", "m")->has_dependency("zlib"));
  CHECK(store.manifest_save_count() == manifests + 1);
}

TEST_CASE("registry::add_dependency: executables depend on package modules") {
  memory_store store;
  seed_package(store);
  registry reg{ store };
  reg.add_executable("/src/main.sac");

  reg.add_dependency(executable_ref{ "/src/main.sac" }, "n", package_dependency{ "P", "n" });
  CHECK(reg.dependency_exists(package_dependency{ "P", "n" }));
  CHECK(reg.get_executable("/src/main.sac")->has_dependency("n"));
}

TEST_CASE("registry::remove_dependency: only an equal edge is removed") {
  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_module(make_module("b"));
  reg.add_dependency(module_ref{ "a" }, "b", edge_to("b"));

  CHECK(error_code_of([&] {
          reg.remove_dependency(module_ref{ "a" }, "b", stray_dependency{ "b", "/x" });
        }) == registry_errc::no_such_dependency);
  CHECK(error_code_of([&] { reg.remove_dependency(module_ref{ "a" }, "c", edge_to("c")); }) ==
        registry_errc::no_such_dependency);
  CHECK(reg.get_module("a")->has_dependency("b"));

  reg.remove_dependency(module_ref{ "a" }, "b", edge_to("b"));
  CHECK_FALSE(reg.get_module("a")->has_dependency("b"));
}

TEST_CASE("registry::remove_module: cascades standalone and stray edges") {
  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_module(make_module("b"));
  reg.add_executable("/src/main.sac");

  reg.add_dependency(module_ref{ "a" }, "b", edge_to("b"));
  reg.add_dependency(executable_ref{ "/src/main.sac" }, "b", edge_to("b"));
  reg.add_dependency(executable_ref{ "/src/main.sac" },
                     "zlib",
                     stray_dependency{ "zlib", "/opt/zlib" });
  reg.add_dependency(module_ref{ "a" }, "bb", stray_dependency{ "b", "/old/b" });

  reg.remove_module("b");

  CHECK(reg.get_module("a")->dependencies().empty());
  auto const *main_exe{ reg.get_executable("/src/main.sac") };
  REQUIRE(main_exe != nullptr);
  CHECK_FALSE(main_exe->has_dependency("b"));
  CHECK(main_exe->has_dependency("zlib"));

  auto const persisted{ registry_from_json(store.document()) };
  CHECK_FALSE(persisted.modules.contains("b"));
  CHECK(persisted.modules.at("a").dependencies().empty());
}

TEST_CASE("registry::remove_*: absent units") {
  memory_store store;
  registry reg{ store };

  CHECK(error_code_of([&] { reg.remove_module("a"); }) ==
        registry_errc::referenced_unit_missing);
  CHECK(error_code_of([&] { reg.remove_executable("/src/main.sac"); }) ==
        registry_errc::referenced_unit_missing);
  CHECK(error_code_of([&] { reg.remove_package("P"); }) ==
        registry_errc::referenced_unit_missing);
  CHECK(error_code_of([&] { reg.remove_package_module("P", "m"); }) ==
        registry_errc::referenced_unit_missing);
  CHECK(store.save_count() == 0);
}

TEST_CASE("registry::remove_item: dispatches on unit kind") {
  memory_store store;
  seed_package(store);
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_executable("/src/main.sac");

  reg.remove_item(executable_ref{ "/src/main.sac" });
  reg.remove_item(module_ref{ "a" });
  reg.remove_item(package_module_ref{ "P", "n" });

  CHECK_FALSE(reg.has_executable("/src/main.sac"));
  CHECK_FALSE(reg.has_module("a"));
  CHECK(reg.get_package_module("P", "n") == nullptr);
  CHECK(reg.get_package_module("P", "m") != nullptr);
}

TEST_CASE("registry::remove_package_module: cascades package edges") {
  memory_store store;
  seed_package(store);
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_dependency(module_ref{ "a" }, "m", package_dependency{ "P", "m" });

  reg.remove_package_module("P", "m");

  CHECK(reg.get_module("a")->dependencies().empty());
  CHECK(reg.get_package_module("P", "n")->dependencies().empty());

  auto const manifest{ store.load_manifest("/work/P") };
  REQUIRE(manifest.has_value());
  CHECK_FALSE(manifest->modules.contains("m"));
}

TEST_CASE("registry::remove_package: cascades every edge into the package") {
  memory_store store;
  seed_package(store);
  registry reg{ store };
  reg.add_executable("/src/main.sac");
  reg.add_dependency(executable_ref{ "/src/main.sac" }, "n", package_dependency{ "P", "n" });
  reg.add_dependency(executable_ref{ "/src/main.sac" },
                     "zlib",
                     stray_dependency{ "zlib", "/opt/zlib" });

  reg.remove_package("P");

  CHECK_FALSE(reg.has_package("P"));
  auto const *main_exe{ reg.get_executable("/src/main.sac") };
  CHECK_FALSE(main_exe->has_dependency("n"));
  CHECK(main_exe->has_dependency("zlib"));
}

TEST_CASE("registry::mark_as_module: keeps the executable's edges") {
  test::temp_dir tmp{ "registry" };
  auto const out{ tmp.make_dir("out/tool") };

  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_executable("/src/tool.sac");
  reg.add_dependency(executable_ref{ "/src/tool.sac" }, "a", edge_to("a"));

  reg.mark_as_module("/src/tool.sac", "tool", out);

  CHECK_FALSE(reg.has_executable("/src/tool.sac"));
  auto const *tool{ reg.get_module("tool") };
  REQUIRE(tool != nullptr);
  CHECK(tool->source == "/src/tool.sac");
  CHECK(tool->output_location == out);
  CHECK(tool->has_dependency("a"));

  // Now a module, so it can be depended upon.
  reg.add_module(make_module("b"));
  reg.add_dependency(module_ref{ "b" },
                     "tool",
                     standalone_dependency{ "/src/tool.sac" });
}

TEST_CASE("registry::mark_as_module: rejections") {
  test::temp_dir tmp{ "registry" };
  auto const out{ tmp.make_dir("out") };

  memory_store store;
  registry reg{ store };
  reg.add_module(make_module("a"));
  reg.add_executable("/src/tool.sac");

  CHECK(error_code_of([&] { reg.mark_as_module("/src/nope.sac", "x", out); }) ==
        registry_errc::referenced_unit_missing);
  CHECK(error_code_of([&] { reg.mark_as_module("/src/tool.sac", "a", out); }) ==
        registry_errc::module_already_in_registry);
  CHECK(error_code_of([&] { reg.mark_as_module("/src/tool.sac", "t", "rel/out"); }) ==
        registry_errc::location_not_absolute);
  CHECK(reg.has_executable("/src/tool.sac"));
}

TEST_CASE("registry: state survives reopening the store") {
  memory_store store;
  {
    registry reg{ store };
    reg.add_module(make_module("a"));
    reg.add_module(make_module("b"));
    reg.add_dependency(module_ref{ "a" }, "b", edge_to("b"));
  }

  registry reopened{ store };
  REQUIRE(reopened.has_module("a"));
  CHECK(reopened.get_module("a")->get_dependency("b") == dependency{ edge_to("b") });
  CHECK(error_code_of([&] {
          reopened.add_dependency(module_ref{ "b" }, "a", edge_to("a"));
        }) == registry_errc::cyclic_dependency);
}

TEST_CASE("registry: malformed document fails construction") {
  memory_store store;
  store.set_document("{ broken");
  CHECK(error_code_of([&] { registry reg{ store }; }) == registry_errc::invalid_registry);
}

TEST_CASE("registry: queries") {
  memory_store store;
  seed_package(store);
  registry reg{ store };
  reg.add_module(standalone_module{ "x", "/work/lib/x.sac", "/out/x" });
  reg.add_module(standalone_module{ "y", "/work/lib/sub/y.sac", "/out/y" });
  reg.add_module(standalone_module{ "z", "/work/library/z.sac", "/out/z" });

  auto const under{ reg.search_modules_by_source_prefix("/work/lib") };
  CHECK(under.size() == 2);

  auto const hits{ reg.search_package_modules("m") };
  REQUIRE(hits.size() == 1);
  CHECK(hits[0].first == "P");
  CHECK(hits[0].second->source == "m.sac");
  CHECK(reg.search_package_modules("q").empty());

  CHECK(reg.dependency_exists(stray_dependency{ "anything", "/nowhere" }));
  CHECK(reg.dependency_exists(standalone_dependency{ "/work/lib/x.sac" }));
  CHECK_FALSE(reg.dependency_exists(standalone_dependency{ "/work/lib/w.sac" }));
  CHECK_FALSE(reg.dependency_exists(package_dependency{ "P", "q" }));

  CHECK(reg.dependency_key(standalone_dependency{ "/work/lib/x.sac" }) == "x");
  CHECK(reg.dependency_key(package_dependency{ "P", "m" }) == "m");
  CHECK(reg.dependency_key(stray_dependency{ "zlib", "/opt" }) == "zlib");
  CHECK(error_code_of([&] { (void)reg.dependency_key(edge_to("nope")); }) ==
        registry_errc::referenced_unit_missing);
}

TEST_CASE("registry::build_package: unknown package") {
  memory_store store;
  registry reg{ store };
  test::recording_compiler cc;
  CHECK(error_code_of([&] { reg.build_package("P", cc); }) ==
        registry_errc::referenced_unit_missing);
}

TEST_CASE("registry::build_package: compiles each module") {
  memory_store store;
  seed_package(store);
  registry reg{ store };
  test::recording_compiler cc;

  reg.build_package("P", cc);

  REQUIRE(cc.requests.size() == 2);
  CHECK(cc.requests[0].source == "/work/P/m.sac");
  CHECK(cc.requests[1].output == "/work/P/n/output");
}

}  // namespace knapsac
