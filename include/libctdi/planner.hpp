#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "binding_graph.hpp"
#include "key.hpp"
#include "options.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace libctdi {

enum class step_kind {
    binding,       // the single binding of a unique or members-injection key
    contribution,  // one contributor of a set/map key
    aggregate      // the set/map built from the contributions just before it
};

constexpr std::string_view to_string(step_kind kind) noexcept {
    constexpr std::string_view names[] = {"binding", "contribution", "aggregate"};
    return names[static_cast<int>(kind)];
}

/// How the emitter should materialize the factory of a step.
enum class creation_strategy {
    stateless,  // unscoped injection binding without dependencies; one shared factory
    instance    // needs a per-component factory instance
};

struct initialization_step {
    step_kind kind = step_kind::binding;
    libctdi::binding_key binding_key;

    /// The binding initialized by this step; nullptr for aggregate steps.
    binding_ptr binding;

    /// 1-based position among the key's contributions (contribution steps).
    std::size_t contribution_number = 0;

    creation_strategy strategy = creation_strategy::instance;
};

struct initialization_batch {
    std::size_t index = 0;
    std::vector<initialization_step> steps;

    /// "initialize", "initialize1", "initialize2", ...
    std::string method_name() const {
        return index == 0 ? std::string("initialize") : "initialize" + std::to_string(index);
    }
};

struct LIBCTDI_EXPORT initialization_plan {
    std::vector<initialization_batch> batches;

    /// Binding keys in initialization order (one entry per key).
    std::vector<binding_key> key_order() const;

    /// All steps across batches, in order.
    std::vector<initialization_step> steps() const;
};

/// Orders a validated graph for emission: dependencies first, set/map
/// contributions immediately before their aggregate, ties broken by
/// resolution order, split into batches of plan_options::batch_size keys.
class LIBCTDI_EXPORT initialization_planner {
public:
    /// Throws invalid_option when batch_size is 0.
    explicit initialization_planner(plan_options options = {});

    /// Throws invariant_violation if the graph still contains a cycle or a
    /// unique key without exactly one binding (i.e. it was not validated).
    initialization_plan plan(const binding_graph& graph) const;

private:
    plan_options options_;
};

} // namespace libctdi
