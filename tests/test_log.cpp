#include <catch2/catch_test_macros.hpp>
#include <libctdi.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace libctdi;

namespace {

struct capture_sink : log::sink {
    std::mutex mutex;
    std::vector<std::string> lines;

    void write(const log::record& rec) override {
        std::lock_guard lock(mutex);
        lines.push_back(std::string(log::to_string(rec.severity)) + " "
                        + std::string(rec.module) + ": " + rec.message);
    }
};

// Restores the default sink and level when a test ends.
struct log_guard {
    log::level saved = log::current_level();
    ~log_guard() {
        log::set_sink(nullptr);
        log::set_level(saved);
    }
};

} // namespace

TEST_CASE("Log: messages below the level are dropped", "[log]") {
    log_guard guard;
    auto sink = std::make_shared<capture_sink>();
    log::set_sink(sink);
    log::set_level(log::level::warn);

    LIBCTDI_LOG_DEBUG("test", "hidden " << 1);
    LIBCTDI_LOG_WARN("test", "shown " << 2);

    REQUIRE(sink->lines == std::vector<std::string>{"WARN test: shown 2"});
}

TEST_CASE("Log: off silences everything", "[log]") {
    log_guard guard;
    auto sink = std::make_shared<capture_sink>();
    log::set_sink(sink);
    log::set_level(log::level::off);

    LIBCTDI_LOG_ERROR("test", "nothing");
    REQUIRE(sink->lines.empty());
    REQUIRE_FALSE(log::enabled(log::level::error));
}

TEST_CASE("Log: graph building and validation log at debug level", "[log]") {
    log_guard guard;
    auto sink = std::make_shared<capture_sink>();
    log::set_sink(sink);
    log::set_level(log::level::debug);

    binding_registry registry;
    registry.add_injectable(injectable_builder("app.Foo").constructor({}).build());
    registry.add_component(component_builder("app.AppComponent").provision("foo", key{"app.Foo"}).build());
    auto results = component_processor(registry).process_all();
    REQUIRE(results[0].succeeded());

    auto has = [&](const std::string& prefix) {
        for (const auto& line : sink->lines) {
            if (line.rfind(prefix, 0) == 0) return true;
        }
        return false;
    };
    REQUIRE(has("DEBUG graph: app.AppComponent: resolved 1 key(s)"));
    REQUIRE(has("DEBUG validator: app.AppComponent: 0 diagnostic(s), clean"));
    REQUIRE(has("DEBUG planner: app.AppComponent: 1 key(s) in 1 batch(es)"));
}
