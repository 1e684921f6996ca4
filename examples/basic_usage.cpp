/// basic_usage.cpp: libctdi introductory example.
///
/// Demonstrates the declare, build, validate and plan workflow:
///   1. Describe modules, injectable types and components with the builders.
///   2. Register them with a binding_registry.
///   3. Let a component_processor build, validate and plan every component.
///   4. Print the diagnostics or the initialization batches.

#include <libctdi.hpp>
#include <iostream>
#include <map>
#include <string>

using namespace libctdi;

int main(int argc, char** argv) {
    // "-Alibctdi.disableInterComponentScopeValidation=warning" style options.
    std::map<std::string, std::string> processor_options;
    if (argc > 1) {
        processor_options[std::string(scope_validation_option)] = argv[1];
    }

    log::set_level(log::level::info);

    binding_registry registry;

    // -----------------------------------------------------------------------
    // Declarations
    // -----------------------------------------------------------------------

    registry.add_module(module_builder("app.NetworkModule")
                            .includes("app.InterceptorModule")
                            .provides("httpClient", key{"app.HttpClient"},
                                      {{key{"app.Config"}, request_kind::instance, "config"},
                                       {key{"Set<app.Interceptor>"}, request_kind::instance,
                                        "interceptors"}},
                                      {.scope = "Singleton"})
                            .build());

    registry.add_module(module_builder("app.InterceptorModule")
                            .provides_into_set("logging", key{"Set<app.Interceptor>"},
                                               {key{"app.Logger"}})
                            .provides_into_set("retry", key{"Set<app.Interceptor>"})
                            .build());

    registry.add_injectable(injectable_builder("app.Config").constructor({}).build());
    registry.add_injectable(injectable_builder("app.Logger").constructor({}).build());
    registry.add_injectable(injectable_builder("app.Repository")
                                .constructor({{key{"app.HttpClient"}, request_kind::instance, "client"}})
                                .inject_field("logger", key{"app.Logger"}, request_kind::lazy)
                                .build());

    registry.add_component(component_builder("app.AppComponent")
                               .scoped("Singleton")
                               .install("app.NetworkModule")
                               .provision("repository", key{"app.Repository"})
                               .provision("client", key{"app.HttpClient"}, request_kind::provider)
                               .build());

    // A session component reusing the scope of its parent: rejected unless
    // scope validation is relaxed.
    registry.add_component(component_builder("app.SessionComponent")
                               .scoped("Session")
                               .depends_on("app.UserComponent")
                               .build());
    registry.add_component(component_builder("app.UserComponent")
                               .scoped("Session")
                               .dependency_type()
                               .build());

    // -----------------------------------------------------------------------
    // Processing
    // -----------------------------------------------------------------------

    try {
        component_processor processor(registry, validation_options_from(processor_options));

        int failures = 0;
        for (const auto& result : processor.process_all()) {
            std::cout << "== " << result.component << "\n";
            if (result.aborted()) {
                std::cout << result.failure << "\n";
                ++failures;
                continue;
            }
            std::cout << result.report->to_string();
            if (!result.succeeded()) {
                ++failures;
                continue;
            }
            for (const auto& batch : result.plan->batches) {
                std::cout << batch.method_name() << "():\n";
                for (const auto& step : batch.steps) {
                    std::cout << "  " << to_string(step.kind) << " "
                              << to_string(step.binding_key);
                    if (step.kind == step_kind::contribution) {
                        std::cout << " #" << step.contribution_number;
                    }
                    if (step.binding) {
                        std::cout << " <- " << format_binding(*step.binding);
                    }
                    std::cout << "\n";
                }
            }
        }
        return failures == 0 ? 0 : 1;
    } catch (const invalid_option& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
}
