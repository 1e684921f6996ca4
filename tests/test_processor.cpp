#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libctdi.hpp>

#include <string>
#include <vector>

using namespace libctdi;
using Catch::Matchers::ContainsSubstring;

namespace {

// Hands out a members-injection binding for a contribution key.
struct rigged_registry : binding_registry {
    std::vector<binding_ptr> declared_bindings(
            const key& k, const std::vector<std::string>& modules) const override {
        auto out = binding_registry::declared_bindings(k, modules);
        if (k == key{"app.Broken"}) {
            out.push_back(make_binding(
                members_injection_binding{key{"app.Broken"}, {}, type_element("app.Broken")}));
        }
        return out;
    }
};

void register_app(binding_registry& registry) {
    registry.add_module(module_builder("app.NetModule")
                            .provides("client", key{"app.Client"}, {key{"app.Config"}})
                            .build());
    registry.add_injectable(injectable_builder("app.Config").constructor({}).build());

    registry.add_component(component_builder("app.Platform")
                               .provision("clock", key{"app.Clock"})
                               .dependency_type()
                               .build());
    registry.add_component(component_builder("app.Good")
                               .install("app.NetModule")
                               .depends_on("app.Platform")
                               .provision("client", key{"app.Client"})
                               .provision("clock", key{"app.Clock"})
                               .build());
    registry.add_component(component_builder("app.Incomplete")
                               .provision("missing", key{"app.Missing"})
                               .build());
    registry.add_component(component_builder("app.Misconfigured")
                               .install("app.NoSuchModule")
                               .build());
}

} // namespace

TEST_CASE("Processor: every component is processed in registration order", "[processor]") {
    binding_registry registry;
    register_app(registry);

    auto results = component_processor(registry).process_all();

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].component == "app.Good");
    REQUIRE(results[1].component == "app.Incomplete");
    REQUIRE(results[2].component == "app.Misconfigured");
}

TEST_CASE("Processor: clean component gets a plan", "[processor]") {
    binding_registry registry;
    register_app(registry);

    auto result = component_processor(registry).process(*registry.find_component("app.Good"));

    REQUIRE(result.succeeded());
    REQUIRE_FALSE(result.aborted());
    REQUIRE(result.report->is_clean());
    REQUIRE(result.plan->key_order().size() == 3);
    REQUIRE(result.graph->find(binding_key::contribution(key{"app.Clock"}))->owning_component
            == "app.Platform");
}

TEST_CASE("Processor: component with errors gets a report but no plan", "[processor]") {
    binding_registry registry;
    register_app(registry);

    auto result = component_processor(registry).process(*registry.find_component("app.Incomplete"));

    REQUIRE_FALSE(result.aborted());
    REQUIRE_FALSE(result.succeeded());
    REQUIRE(result.graph.has_value());
    REQUIRE(result.report->count(diagnostic_kind::missing_binding) == 1);
    REQUIRE_FALSE(result.plan.has_value());
}

TEST_CASE("Processor: unknown module aborts only that component", "[processor]") {
    binding_registry registry;
    register_app(registry);

    auto results = component_processor(registry).process_all();
    const auto& failed = results[2];

    REQUIRE(failed.aborted());
    REQUIRE_FALSE(failed.graph.has_value());
    REQUIRE_FALSE(failed.report.has_value());
    REQUIRE_THAT(failed.failure, ContainsSubstring("Unknown module: app.NoSuchModule"));

    REQUIRE(results[0].succeeded());
}

TEST_CASE("Processor: broken engine invariant aborts the component", "[processor]") {
    rigged_registry registry;
    registry.add_component(component_builder("app.BrokenComponent")
                               .provision("broken", key{"app.Broken"})
                               .build());
    registry.add_injectable(injectable_builder("app.Fine").constructor({}).build());
    registry.add_component(component_builder("app.FineComponent")
                               .provision("fine", key{"app.Fine"})
                               .build());

    auto results = component_processor(registry).process_all();

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].aborted());
    REQUIRE(results[0].graph.has_value());
    REQUIRE_FALSE(results[0].plan.has_value());
    REQUIRE_THAT(results[0].failure, ContainsSubstring("Internal invariant violated"));
    REQUIRE(results[1].succeeded());
}

TEST_CASE("Processor: validation options are applied", "[processor][options]") {
    binding_registry registry;
    registry.add_component(component_builder("app.Y").scoped("Session").build());
    registry.add_component(component_builder("app.X").scoped("Session").depends_on("app.Y").build());

    auto strict = component_processor(registry).process_all();
    REQUIRE_FALSE(strict[1].succeeded());

    auto lenient = component_processor(
        registry, validation_options_from({{std::string(scope_validation_option), "warning"}}))
        .process_all();
    REQUIRE(lenient[1].succeeded());
    REQUIRE(lenient[1].report->items().size() == 1);
    REQUIRE(lenient[1].report->items()[0].severity == severity_level::warning);
}
