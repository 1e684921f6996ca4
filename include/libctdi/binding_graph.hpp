#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "component.hpp"
#include "key.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace libctdi {

class binding_lookup;

// ---------------------------------------------------------------
// resolved_bindings: everything that satisfies one binding key
// ---------------------------------------------------------------

struct LIBCTDI_EXPORT resolved_bindings {
    libctdi::binding_key binding_key;

    /// The component whose graph owns the bindings: the component being
    /// resolved, or the dependency component exposing a provision method.
    std::string owning_component;

    std::vector<binding_ptr> bindings;

    std::vector<binding_ptr> contribution_bindings() const;
    std::vector<binding_ptr> members_injection_bindings() const;
};

// ---------------------------------------------------------------
// binding_graph
// ---------------------------------------------------------------

/// Resolved bindings of one component, keyed by binding key.  Built once by
/// binding_graph_factory and immutable afterwards.
class LIBCTDI_EXPORT binding_graph {
public:
    const component_descriptor& component() const noexcept { return component_; }
    const std::vector<dependency_request>& entry_points() const noexcept {
        return component_.entry_points;
    }

    /// Modules installed by the component, including transitively included
    /// ones, in declaration order.
    const std::vector<std::string>& transitive_modules() const noexcept { return modules_; }

    /// All resolved bindings in resolution order.
    const std::vector<resolved_bindings>& resolved() const noexcept { return resolved_; }

    /// nullptr if `bk` is not reachable from any entry point.
    const resolved_bindings* find(const binding_key& bk) const;

    /// Position of `bk` in resolved().  Throws invariant_violation if absent.
    std::size_t index_of(const binding_key& bk) const;

private:
    friend class binding_graph_factory;

    binding_graph(component_descriptor component, std::vector<std::string> modules,
                  std::vector<resolved_bindings> resolved);

    component_descriptor component_;
    std::vector<std::string> modules_;
    std::vector<resolved_bindings> resolved_;
    std::map<binding_key, std::size_t> index_;
};

// ---------------------------------------------------------------
// binding_graph_factory
// ---------------------------------------------------------------

class LIBCTDI_EXPORT binding_graph_factory {
public:
    explicit binding_graph_factory(binding_lookup& lookup) noexcept : lookup_(lookup) {}

    /// Resolve the transitive closure of the component's entry points.
    /// Throws not_found when the component names an unknown module or
    /// dependency.  Missing bindings are not errors here: they resolve to
    /// an empty resolved_bindings for the validator to report.
    binding_graph create(const component_descriptor& component) const;

private:
    binding_lookup& lookup_;
};

} // namespace libctdi
