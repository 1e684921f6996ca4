#pragma once

#include "export.hpp"
#include "binding_graph.hpp"
#include "diagnostic.hpp"
#include "options.hpp"
#include "planner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace libctdi {

class binding_registry;

/// Outcome of processing one component.
struct component_result {
    std::string component;

    /// Absent when processing aborted before the graph was built.
    std::optional<binding_graph> graph;
    std::optional<validation_report> report;

    /// Present only when the report is clean.
    std::optional<initialization_plan> plan;

    /// Non-empty when processing aborted (unknown module or dependency,
    /// broken engine invariant).  Full diagnostic text of the error.
    std::string failure;

    bool aborted() const noexcept { return !failure.empty(); }
    bool succeeded() const noexcept { return !aborted() && plan.has_value(); }
};

/// Drives graph building, validation and planning for the components of a registry.
/// Each component is processed in isolation: a failure in one never
/// affects another.
class LIBCTDI_EXPORT component_processor {
public:
    explicit component_processor(binding_registry& registry,
                                 validation_options validation = {},
                                 plan_options planning = {});

    component_result process(const component_descriptor& component) const;

    /// Every registered descriptor with is_component set, in registration order.
    std::vector<component_result> process_all() const;

private:
    binding_registry& registry_;
    validation_options validation_;
    plan_options planning_;
};

} // namespace libctdi
