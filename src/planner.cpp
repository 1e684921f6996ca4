#include "libctdi/planner.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/log.hpp"

#include <functional>
#include <queue>
#include <set>
#include <string>
#include <vector>

namespace libctdi {

// ---------------------------------------------------------------
// initialization_plan
// ---------------------------------------------------------------

std::vector<binding_key> initialization_plan::key_order() const {
    std::vector<binding_key> keys;
    for (const auto& batch : batches) {
        for (const auto& step : batch.steps) {
            if (step.kind != step_kind::contribution) {
                keys.push_back(step.binding_key);
            }
        }
    }
    return keys;
}

std::vector<initialization_step> initialization_plan::steps() const {
    std::vector<initialization_step> all;
    for (const auto& batch : batches) {
        all.insert(all.end(), batch.steps.begin(), batch.steps.end());
    }
    return all;
}

// ---------------------------------------------------------------
// initialization_planner
// ---------------------------------------------------------------

namespace {

creation_strategy strategy_for(const binding& b) {
    const auto* provision = std::get_if<provision_binding>(&b);
    if (provision && provision->kind == binding_kind::injection
        && provision->type == binding_type::unique && provision->dependencies.empty()
        && !provision->members_injection_request.has_value() && !provision->scope.has_value()) {
        return creation_strategy::stateless;
    }
    return creation_strategy::instance;
}

// Multibinding keys are planned as contributions plus an aggregate; every
// other key must hold exactly one binding by now.
bool check_cardinality(const binding_graph& graph, const resolved_bindings& resolved) {
    const auto& bindings = resolved.bindings;
    auto fail = [&](const std::string& what) {
        throw invariant_violation(to_string(resolved.binding_key) + " " + what
                                  + " in the graph of " + graph.component().type
                                  + "; plan only validated graphs");
    };
    if (bindings.empty()) fail("has no binding");

    auto type = binding_type_of(*bindings.front());
    for (const auto& b : bindings) {
        if (binding_type_of(*b) != type) fail("mixes binding types");
    }
    // A synthesized map wraps the aggregate of another key; it is planned
    // like a unique binding.
    if (kind_of(*bindings.front()) == binding_kind::synthetic_map) {
        if (bindings.size() != 1) fail("mixes a synthesized map with declared bindings");
        return false;
    }
    bool multibinding = type.has_value() && is_multibinding(*type);
    if (!multibinding && bindings.size() != 1) fail("has duplicate bindings");
    return multibinding;
}

} // anonymous namespace

initialization_planner::initialization_planner(plan_options options)
    : options_(options)
{
    if (options_.batch_size == 0) {
        throw invalid_option("plan_options::batch_size", "0", "a positive number of keys");
    }
}

initialization_plan initialization_planner::plan(const binding_graph& graph) const {
    const auto& resolved = graph.resolved();
    const auto n = resolved.size();

    // Edges run from a dependency to the keys that need it.
    std::vector<std::set<std::size_t>> dependants(n);
    std::vector<std::size_t> in_degree(n, 0);
    std::vector<bool> multibinding(n, false);

    for (std::size_t i = 0; i < n; ++i) {
        multibinding[i] = check_cardinality(graph, resolved[i]);
        for (const auto& b : resolved[i].bindings) {
            for (const auto& dep : implicit_dependencies_of(*b)) {
                auto j = graph.index_of(binding_key_for(dep));
                if (j == i) {
                    throw invariant_violation(to_string(resolved[i].binding_key)
                                              + " depends on itself");
                }
                if (dependants[j].insert(i).second) {
                    ++in_degree[i];
                }
            }
        }
    }

    // Kahn's algorithm; among ready keys the earliest resolved goes first.
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t i = 0; i < n; ++i) {
        if (in_degree[i] == 0) ready.push(i);
    }

    std::vector<std::size_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        auto i = ready.top();
        ready.pop();
        order.push_back(i);
        for (auto d : dependants[i]) {
            if (--in_degree[d] == 0) ready.push(d);
        }
    }
    if (order.size() != n) {
        throw invariant_violation("Dependency cycle left in the graph of "
                                  + graph.component().type + "; plan only validated graphs");
    }

    initialization_plan result;
    for (std::size_t pos = 0; pos < order.size(); ++pos) {
        if (pos % options_.batch_size == 0) {
            result.batches.push_back({result.batches.size(), {}});
        }
        auto& steps = result.batches.back().steps;
        const auto& r = resolved[order[pos]];

        if (!multibinding[order[pos]]) {
            const auto& b = r.bindings.front();
            steps.push_back({step_kind::binding, r.binding_key, b, 0, strategy_for(*b)});
            continue;
        }
        for (std::size_t k = 0; k < r.bindings.size(); ++k) {
            const auto& b = r.bindings[k];
            steps.push_back({step_kind::contribution, r.binding_key, b, k + 1, strategy_for(*b)});
        }
        steps.push_back({step_kind::aggregate, r.binding_key, nullptr, 0,
                         creation_strategy::instance});
    }

    LIBCTDI_LOG_DEBUG("planner", graph.component().type << ": " << n << " key(s) in "
                      << result.batches.size() << " batch(es)");
    return result;
}

} // namespace libctdi
