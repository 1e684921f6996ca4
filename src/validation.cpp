#include "libctdi/validator.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/log.hpp"
#include "libctdi/registry.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>
#include <string>
#include <vector>

namespace libctdi {

namespace {

constexpr const char* indent = "    ";

std::string format_scope(const std::string& scope) {
    return "@" + scope;
}

// Per-entry-point traversal state.  The path holds every request from the
// entry point (front) down to the request being visited (back).
struct traversal_context {
    const binding_graph& graph;
    std::vector<dependency_request> path;
    std::set<binding_key> visited;
    validation_report& report;

    const dependency_request& root() const { return path.front(); }
    const dependency_request& current() const { return path.back(); }

    /// One line per request below the entry point.
    std::string rendered_path() const {
        std::string out;
        for (std::size_t i = 1; i < path.size(); ++i) {
            out += "\n" + format_request(path[i]);
        }
        return out;
    }
};

// Union of the implicit dependencies of every binding, first occurrence wins.
std::vector<dependency_request> all_dependencies(const resolved_bindings& resolved) {
    std::vector<dependency_request> deps;
    for (const auto& b : resolved.bindings) {
        for (auto& dep : implicit_dependencies_of(*b)) {
            if (std::find(deps.begin(), deps.end(), dep) == deps.end()) {
                deps.push_back(std::move(dep));
            }
        }
    }
    return deps;
}

// ------------------------------------------------------------------
// Component-level scope checks
// ------------------------------------------------------------------

std::vector<const component_descriptor*> scoped_dependencies_of(
        const binding_lookup& lookup, const component_descriptor& component) {
    std::vector<const component_descriptor*> scoped;
    for (const auto& name : component.dependencies) {
        const auto* dependency = lookup.find_component(name);
        if (dependency && dependency->scope.has_value()) {
            scoped.push_back(dependency);
        }
    }
    return scoped;
}

std::string format_component_list(const std::vector<const component_descriptor*>& components) {
    std::string out;
    for (const auto* c : components) {
        out += "\n";
        out += indent;
        if (c->scope.has_value()) out += format_scope(*c->scope) + " ";
        out += c->type;
    }
    return out;
}

void check_component_scope(const binding_graph& graph, validation_report& report) {
    const auto& component = graph.component();
    std::vector<std::string> offenders;

    for (const auto& resolved : graph.resolved()) {
        if (resolved.binding_key.kind != binding_key_kind::contribution) continue;
        for (const auto& b : resolved.bindings) {
            const auto* provision = std::get_if<provision_binding>(b.get());
            if (!provision || !provision->scope.has_value()
                || provision->scope == component.scope) {
                continue;
            }
            std::string entry;
            switch (provision->kind) {
                case binding_kind::provision:
                    entry = format_binding(*b);
                    break;
                case binding_kind::injection:
                    entry = format_scope(*provision->scope) + " class " + provision->key.type;
                    break;
                case binding_kind::component:
                case binding_kind::component_provision:
                case binding_kind::production:
                case binding_kind::members_injection:
                case binding_kind::synthetic_map:
                    throw invariant_violation("Unexpected scoped binding " + format_binding(*b)
                                              + " in " + component.type);
            }
            if (std::find(offenders.begin(), offenders.end(), entry) == offenders.end()) {
                offenders.push_back(std::move(entry));
            }
        }
    }
    if (offenders.empty()) return;

    std::string message = component.type;
    message += component.scope.has_value()
        ? " scoped with " + format_scope(*component.scope)
              + " may not reference bindings with different scopes:"
        : std::string(" (unscoped) may not reference scoped bindings:");
    for (const auto& entry : offenders) {
        message += "\n";
        message += indent;
        message += entry;
    }
    report.add({severity_level::error, diagnostic_kind::scope_mismatch, std::move(message),
                {component.element()}});
}

// Follows the single scoped dependency of each component from the root and
// reports the first scope that appears twice.
void walk_scope_chain(const binding_lookup& lookup, const component_descriptor& root,
                      const component_descriptor& current, severity_level severity,
                      std::vector<std::string>& scopes,
                      std::vector<const component_descriptor*>& chain,
                      validation_report& report) {
    if (!current.scope.has_value()) return;

    if (std::find(scopes.begin(), scopes.end(), *current.scope) != scopes.end()) {
        chain.push_back(&current);
        report.add({severity, diagnostic_kind::scope_hierarchy_violation,
                    root.type + " depends on scoped components in a non-hierarchical"
                                " scope ordering:" + format_component_list(chain),
                    {root.element()}});
        chain.pop_back();
        return;
    }
    if (!current.is_component) return;

    auto scoped = scoped_dependencies_of(lookup, current);
    if (scoped.size() != 1) return;

    scopes.push_back(*current.scope);
    chain.push_back(&current);
    walk_scope_chain(lookup, root, *scoped.front(), severity, scopes, chain, report);
    chain.pop_back();
    scopes.pop_back();
}

void check_dependency_scopes(const binding_lookup& lookup, const validation_options& options,
                             const component_descriptor& component, validation_report& report) {
    auto scoped = scoped_dependencies_of(lookup, component);

    if (!component.scope.has_value()) {
        if (!scoped.empty()) {
            report.add({severity_level::error, diagnostic_kind::scope_hierarchy_violation,
                        component.type + " (unscoped) cannot depend on scoped components:"
                            + format_component_list(scoped),
                        {component.element()}});
        }
        return;
    }

    const auto& scope = *component.scope;
    if (scope == options.terminal_scope) {
        // The broadest scope ends every chain, whatever the chain option says.
        if (!scoped.empty()) {
            report.add({severity_level::error, diagnostic_kind::scope_hierarchy_violation,
                        component.type + " scoped with " + format_scope(scope)
                            + " cannot depend on scoped components:"
                            + format_component_list(scoped),
                        {component.element()}});
        }
        return;
    }

    if (scoped.size() > 1) {
        report.add({severity_level::error, diagnostic_kind::scope_hierarchy_violation,
                    format_scope(scope) + " " + component.type
                        + " depends on more than one scoped component:"
                        + format_component_list(scoped),
                    {component.element()}});
        return;
    }

    auto severity = diagnostic_severity(options.scope_hierarchy);
    if (!severity.has_value()) return;

    std::vector<std::string> scopes;
    std::vector<const component_descriptor*> chain;
    walk_scope_chain(lookup, component, component, *severity, scopes, chain, report);
}

// ------------------------------------------------------------------
// Resolved-binding checks
// ------------------------------------------------------------------

class graph_traversal {
public:
    graph_traversal(const binding_lookup& lookup, const validation_options& options)
        : lookup_(lookup), options_(options)
    {}

    void traverse(traversal_context& ctx, const dependency_request& request) const {
        auto bk = binding_key_for(request);

        for (const auto& frame : ctx.path) {
            if (binding_key_for(frame) == bk) {
                ctx.path.push_back(request);
                report_cycle(ctx);
                ctx.path.pop_back();
                return;
            }
        }
        if (!ctx.visited.insert(bk).second) return;

        const auto* resolved = ctx.graph.find(bk);
        if (!resolved) {
            throw invariant_violation("No resolved bindings for " + to_string(bk)
                                      + " in the graph of " + ctx.graph.component().type);
        }

        ctx.path.push_back(request);
        if (validate_resolved(ctx, *resolved)) {
            for (const auto& dep : all_dependencies(*resolved)) {
                traverse(ctx, dep);
            }
        }
        ctx.path.pop_back();
    }

private:
    // True when the bindings are usable and their dependencies should be
    // visited.
    bool validate_resolved(traversal_context& ctx, const resolved_bindings& resolved) const {
        if (resolved.bindings.empty()) {
            report_missing(ctx);
            return false;
        }

        auto contributions = resolved.contribution_bindings();
        auto members = resolved.members_injection_bindings();

        switch (resolved.binding_key.kind) {
            case binding_key_kind::contribution: {
                if (!members.empty()) {
                    throw invariant_violation("Contribution key " + to_string(resolved.binding_key)
                                              + " holds members-injection bindings");
                }
                if (contributions.size() <= 1) return true;

                std::set<binding_type> types;
                for (const auto& b : contributions) types.insert(*binding_type_of(*b));
                if (types.size() > 1) {
                    report_multiple_binding_types(ctx, contributions);
                    return false;
                }
                if (*types.begin() == binding_type::unique) {
                    report_duplicates(ctx, contributions);
                    return false;
                }
                return true;
            }
            case binding_key_kind::members_injection:
                if (!contributions.empty()) {
                    throw invariant_violation("Members-injection key "
                                              + to_string(resolved.binding_key)
                                              + " holds contribution bindings");
                }
                if (members.size() > 1) {
                    report_duplicates(ctx, members);
                    return false;
                }
                return true;
        }
        return true;
    }

    void report_missing(traversal_context& ctx) const {
        const auto& k = ctx.current().key;
        std::string message = to_string(k);
        message += is_valid_implicit_provision_key(k)
            ? " cannot be provided without an injectable constructor or a provider method."
            : " cannot be provided without a provider method.";
        if (!k.qualifier.has_value() && lookup_.has_injection_sites(k.type)) {
            message += " This type supports members injection but cannot be implicitly provided.";
        }
        message += ctx.rendered_path();
        ctx.report.add({severity_level::error, diagnostic_kind::missing_binding,
                        std::move(message), {ctx.root().element}});
    }

    void report_duplicates(traversal_context& ctx, const std::vector<binding_ptr>& bindings) const {
        std::string message = to_string(ctx.current().key) + " is bound multiple times:";
        std::size_t limit = options_.duplicate_listing_limit;
        std::vector<source_element> elements;
        for (std::size_t i = 0; i < bindings.size() && i < limit; ++i) {
            message += "\n";
            message += indent;
            message += format_binding(*bindings[i]);
            elements.push_back(element_of(*bindings[i]));
        }
        if (bindings.size() > limit) {
            auto others = bindings.size() - limit;
            message += "\n";
            message += indent;
            message += "and " + std::to_string(others) + (others == 1 ? " other" : " others");
        }
        ctx.report.add({severity_level::error, diagnostic_kind::duplicate_bindings,
                        std::move(message), std::move(elements)});
    }

    void report_multiple_binding_types(traversal_context& ctx,
                                       const std::vector<binding_ptr>& bindings) const {
        std::map<binding_type, std::vector<binding_ptr>> by_type;
        for (const auto& b : bindings) by_type[*binding_type_of(*b)].push_back(b);

        std::string message = to_string(ctx.current().key) + " used for multiple binding types:";
        std::vector<source_element> elements;
        for (const auto& [type, group] : by_type) {
            message += "\n";
            message += indent;
            message += std::string(to_string(type)) + " bindings:";
            for (const auto& b : group) {
                message += "\n";
                message += indent;
                message += indent;
                message += format_binding(*b);
                elements.push_back(element_of(*b));
            }
        }
        ctx.report.add({severity_level::error, diagnostic_kind::multiple_binding_types,
                        std::move(message), std::move(elements)});
    }

    void report_cycle(traversal_context& ctx) const {
        const auto& root = ctx.root().element;
        std::string message = root.enclosing + "." + root.name
                            + "() contains a dependency cycle:" + ctx.rendered_path();
        ctx.report.add({severity_level::error, diagnostic_kind::dependency_cycle,
                        std::move(message), {root, ctx.current().element}});
    }

    const binding_lookup& lookup_;
    const validation_options& options_;
};

} // anonymous namespace

// ------------------------------------------------------------------
// binding_graph_validator
// ------------------------------------------------------------------

binding_graph_validator::binding_graph_validator(const binding_lookup& lookup,
                                                 validation_options options)
    : lookup_(lookup)
    , options_(std::move(options))
{}

validation_report binding_graph_validator::validate(const binding_graph& graph) const {
    const auto& component = graph.component();
    validation_report report(component.type);

    check_component_scope(graph, report);
    check_dependency_scopes(lookup_, options_, component, report);

    graph_traversal traversal(lookup_, options_);
    for (const auto& entry : graph.entry_points()) {
        traversal_context ctx{graph, {}, {}, report};
        traversal.traverse(ctx, entry);
    }

    LIBCTDI_LOG_DEBUG("validator", component.type << ": " << report.items().size()
                      << " diagnostic(s), " << (report.is_clean() ? "clean" : "not clean"));
    return report;
}

} // namespace libctdi
