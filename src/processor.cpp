#include "libctdi/processor.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/log.hpp"
#include "libctdi/registry.hpp"
#include "libctdi/validator.hpp"
#include "registration_trace.hpp"

#include <string>
#include <utility>
#include <vector>

namespace libctdi {

component_processor::component_processor(binding_registry& registry,
                                         validation_options validation,
                                         plan_options planning)
    : registry_(registry)
    , validation_(std::move(validation))
    , planning_(planning)
{}

component_result component_processor::process(const component_descriptor& component) const {
    component_result result;
    result.component = component.type;

    try {
        binding_graph_factory factory(registry_);
        result.graph.emplace(factory.create(component));

        binding_graph_validator validator(registry_, validation_);
        result.report.emplace(validator.validate(*result.graph));

        if (result.report->is_clean()) {
            initialization_planner planner(planning_);
            result.plan.emplace(planner.plan(*result.graph));
        } else {
            LIBCTDI_LOG_INFO("processor", component.type << " has errors:\n"
                             << result.report->to_string());
        }
    } catch (di_error& ex) {
        if (ex.diagnostic_detail().empty()) {
            ex.set_diagnostic_detail(internal::format_registration_trace(component));
        }
        result.failure = ex.full_diagnostic();
        result.plan.reset();
        LIBCTDI_LOG_ERROR("processor", "aborted " << component.type << ": " << ex.what());
    }
    return result;
}

std::vector<component_result> component_processor::process_all() const {
    std::vector<component_result> results;
    for (const auto& component : registry_.components()) {
        if (!component.is_component) continue;
        results.push_back(process(component));
    }
    return results;
}

} // namespace libctdi
