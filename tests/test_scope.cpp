#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libctdi.hpp>

#include <string>

using namespace libctdi;
using Catch::Matchers::ContainsSubstring;

namespace {

validation_report validate(binding_registry& registry, const std::string& component,
                           validation_options options = {}) {
    const auto* descriptor = registry.find_component(component);
    REQUIRE(descriptor != nullptr);
    auto graph = binding_graph_factory(registry).create(*descriptor);
    return binding_graph_validator(registry, options).validate(graph);
}

// app.X (Session) -> app.Y (Session) -> app.App (App)
void register_repeated_scope(binding_registry& registry) {
    registry.add_component(component_builder("app.App").scoped("App").build());
    registry.add_component(component_builder("app.Y").scoped("Session").depends_on("app.App").build());
    registry.add_component(component_builder("app.X").scoped("Session").depends_on("app.Y").build());
}

} // namespace

// ---------------------------------------------------------------
// Inter-component hierarchy
// ---------------------------------------------------------------

TEST_CASE("Scope: repeated scope in the dependency chain is a violation", "[scope]") {
    binding_registry registry;
    register_repeated_scope(registry);

    auto report = validate(registry, "app.X");

    REQUIRE(report.items().size() == 1);
    const auto& d = report.items()[0];
    REQUIRE(d.kind == diagnostic_kind::scope_hierarchy_violation);
    REQUIRE(d.severity == severity_level::error);
    REQUIRE(d.message == "app.X depends on scoped components in a non-hierarchical scope ordering:\n"
                         "    @Session app.X\n"
                         "    @Session app.Y");
    REQUIRE(to_string(d.elements[0]) == "app.X");

    REQUIRE(validate(registry, "app.Y").is_clean());
}

TEST_CASE("Scope: repeated scope further up the chain is found", "[scope]") {
    binding_registry registry;
    registry.add_component(component_builder("app.Root").scoped("Activity").build());
    registry.add_component(component_builder("app.Mid").scoped("Session").depends_on("app.Root").build());
    registry.add_component(component_builder("app.Leaf").scoped("Activity").depends_on("app.Mid").build());

    auto report = validate(registry, "app.Leaf");

    REQUIRE(report.count(diagnostic_kind::scope_hierarchy_violation) == 1);
    REQUIRE_THAT(report.items()[0].message,
                 ContainsSubstring("    @Activity app.Leaf\n"
                                   "    @Session app.Mid\n"
                                   "    @Activity app.Root"));
}

TEST_CASE("Scope: hierarchical chain ending in the terminal scope is clean", "[scope]") {
    binding_registry registry;
    registry.add_component(component_builder("app.App").scoped("Singleton").build());
    registry.add_component(component_builder("app.Session").scoped("Session").depends_on("app.App").build());
    registry.add_component(component_builder("app.Activity").scoped("Activity").depends_on("app.Session").build());

    REQUIRE(validate(registry, "app.Activity").is_clean());
    REQUIRE(validate(registry, "app.Session").is_clean());
    REQUIRE(validate(registry, "app.App").is_clean());
}

TEST_CASE("Scope: chain check severity follows the option", "[scope][options]") {
    binding_registry registry;
    register_repeated_scope(registry);

    auto warned = validate(registry, "app.X", {.scope_hierarchy = scope_cycle_validation::warning});
    REQUIRE(warned.items().size() == 1);
    REQUIRE(warned.items()[0].severity == severity_level::warning);
    REQUIRE(warned.is_clean());

    auto disabled = validate(registry, "app.X", {.scope_hierarchy = scope_cycle_validation::none});
    REQUIRE(disabled.items().empty());
}

TEST_CASE("Scope: terminal scope may not depend on scoped components", "[scope]") {
    binding_registry registry;
    registry.add_component(component_builder("app.Session").scoped("Session").build());
    registry.add_component(component_builder("app.App").scoped("Singleton").depends_on("app.Session").build());

    for (auto level : {scope_cycle_validation::error, scope_cycle_validation::warning,
                       scope_cycle_validation::none}) {
        auto report = validate(registry, "app.App", {.scope_hierarchy = level});
        REQUIRE(report.count(diagnostic_kind::scope_hierarchy_violation) == 1);
        REQUIRE(report.items()[0].severity == severity_level::error);
        REQUIRE(report.items()[0].message
                == "app.App scoped with @Singleton cannot depend on scoped components:\n"
                   "    @Session app.Session");
    }
}

TEST_CASE("Scope: terminal scope name is configurable", "[scope]") {
    binding_registry registry;
    registry.add_component(component_builder("app.Session").scoped("Session").build());
    registry.add_component(component_builder("app.App").scoped("AppScope").depends_on("app.Session").build());

    REQUIRE(validate(registry, "app.App").is_clean());
    REQUIRE_FALSE(validate(registry, "app.App", {.terminal_scope = "AppScope"}).is_clean());
}

TEST_CASE("Scope: at most one scoped dependency", "[scope]") {
    binding_registry registry;
    registry.add_component(component_builder("app.A").scoped("A").build());
    registry.add_component(component_builder("app.B").scoped("B").build());
    registry.add_component(component_builder("app.Plain").build());
    registry.add_component(component_builder("app.C")
                               .scoped("C")
                               .depends_on("app.A")
                               .depends_on("app.Plain")
                               .depends_on("app.B")
                               .build());

    auto report = validate(registry, "app.C", {.scope_hierarchy = scope_cycle_validation::none});

    REQUIRE(report.items().size() == 1);
    REQUIRE(report.items()[0].message == "@C app.C depends on more than one scoped component:\n"
                                         "    @A app.A\n"
                                         "    @B app.B");
}

TEST_CASE("Scope: unscoped component may not depend on scoped components", "[scope]") {
    binding_registry registry;
    registry.add_component(component_builder("app.Session").scoped("Session").build());
    registry.add_component(component_builder("app.Plain").build());
    registry.add_component(component_builder("app.Child").depends_on("app.Session").build());
    registry.add_component(component_builder("app.Other").depends_on("app.Plain").build());

    auto report = validate(registry, "app.Child");
    REQUIRE(report.count(diagnostic_kind::scope_hierarchy_violation) == 1);
    REQUIRE_THAT(report.items()[0].message,
                 ContainsSubstring("app.Child (unscoped) cannot depend on scoped components"));

    REQUIRE(validate(registry, "app.Other").is_clean());
}

TEST_CASE("Scope: scoped dependency types count but are not followed", "[scope]") {
    binding_registry registry;
    registry.add_component(component_builder("app.Shared").scoped("Session").build());
    registry.add_component(component_builder("app.Api")
                               .scoped("Api")
                               .depends_on("app.Shared")
                               .dependency_type()
                               .build());
    registry.add_component(component_builder("app.Client").scoped("Session").depends_on("app.Api").build());

    REQUIRE(validate(registry, "app.Client").is_clean());
}

// ---------------------------------------------------------------
// Binding scopes
// ---------------------------------------------------------------

TEST_CASE("Scope: differently scoped bindings are reported together", "[scope]") {
    binding_registry registry;
    registry.add_module(module_builder("app.M")
                            .provides("foo", key{"app.Foo"}, {key{"app.Bar"}},
                                      {.scope = "Session"})
                            .build());
    registry.add_injectable(injectable_builder("app.Bar").constructor({}).scoped("Request").build());
    registry.add_injectable(injectable_builder("app.Baz").constructor({}).scoped("Singleton").build());
    registry.add_component(component_builder("app.AppComponent")
                               .scoped("Singleton")
                               .install("app.M")
                               .provision("foo", key{"app.Foo"})
                               .provision("baz", key{"app.Baz"})
                               .build());

    auto report = validate(registry, "app.AppComponent");

    REQUIRE(report.items().size() == 1);
    const auto& d = report.items()[0];
    REQUIRE(d.kind == diagnostic_kind::scope_mismatch);
    REQUIRE(d.message == "app.AppComponent scoped with @Singleton may not reference bindings"
                         " with different scopes:\n"
                         "    @Provides app.Foo app.M.foo(app.Bar)\n"
                         "    @Request class app.Bar");
}

TEST_CASE("Scope: unscoped component may not use scoped bindings", "[scope]") {
    binding_registry registry;
    registry.add_injectable(injectable_builder("app.Cache").constructor({}).scoped("Singleton").build());
    registry.add_injectable(injectable_builder("app.Plain").constructor({}).build());
    registry.add_component(component_builder("app.AppComponent")
                               .provision("cache", key{"app.Cache"})
                               .provision("plain", key{"app.Plain"})
                               .build());

    auto report = validate(registry, "app.AppComponent");

    REQUIRE(report.count(diagnostic_kind::scope_mismatch) == 1);
    REQUIRE(report.items()[0].message == "app.AppComponent (unscoped) may not reference scoped"
                                         " bindings:\n"
                                         "    @Singleton class app.Cache");
}

TEST_CASE("Scope: unscoped bindings are usable from any component", "[scope]") {
    binding_registry registry;
    registry.add_injectable(injectable_builder("app.Plain").constructor({}).build());
    registry.add_injectable(injectable_builder("app.Session").constructor({}).scoped("Session").build());
    registry.add_component(component_builder("app.SessionComponent")
                               .scoped("Session")
                               .provision("plain", key{"app.Plain"})
                               .provision("session", key{"app.Session"})
                               .build());

    REQUIRE(validate(registry, "app.SessionComponent").is_clean());
}
