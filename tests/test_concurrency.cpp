#include <catch2/catch_test_macros.hpp>
#include <libctdi.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace libctdi;

TEST_CASE("Concurrency: synthesis under contention yields one binding", "[concurrency]") {
    binding_registry registry;
    registry.add_injectable(injectable_builder("app.Foo").constructor({key{"app.Bar"}}).build());
    registry.add_injectable(injectable_builder("app.Bar").constructor({}).build());

    constexpr std::size_t N = 32;
    std::vector<std::jthread> threads;
    std::vector<binding_ptr> foos(N);
    std::vector<binding_ptr> members(N);

    for (std::size_t i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            foos[i] = registry.synthesize_injectable("app.Foo");
            members[i] = registry.synthesize_members_injection("app.Foo");
        });
    }
    threads.clear(); // join all

    REQUIRE(foos[0] != nullptr);
    for (std::size_t i = 1; i < N; ++i) {
        REQUIRE(foos[i] == foos[0]);
        REQUIRE(members[i] == members[0]);
    }
}

TEST_CASE("Concurrency: components are processed independently in parallel", "[concurrency]") {
    binding_registry registry;
    registry.add_injectable(injectable_builder("app.Shared").constructor({}).build());
    constexpr int N = 16;
    for (int i = 0; i < N; ++i) {
        auto type = "app.Service" + std::to_string(i);
        registry.add_injectable(injectable_builder(type).constructor({key{"app.Shared"}}).build());
        registry.add_component(component_builder("app.Component" + std::to_string(i))
                                   .provision("service", key{type})
                                   .build());
    }

    component_processor processor(registry);
    std::vector<std::jthread> threads;
    std::vector<component_result> results(N);
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            results[i] = processor.process(registry.components()[i]);
        });
    }
    threads.clear();

    binding_ptr shared;
    for (const auto& result : results) {
        REQUIRE(result.succeeded());
        const auto* resolved = result.graph->find(binding_key::contribution(key{"app.Shared"}));
        REQUIRE(resolved != nullptr);
        if (!shared) shared = resolved->bindings[0];
        REQUIRE(resolved->bindings[0] == shared);
    }
}
