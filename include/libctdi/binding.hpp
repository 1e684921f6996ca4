#pragma once

#include "export.hpp"
#include "dependency_request.hpp"
#include "key.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace libctdi {

/// Whether a contribution is the sole provider of its key or one of many
/// entries feeding a set or map.
enum class binding_type {
    unique,
    set,
    map
};

constexpr std::string_view to_string(binding_type type) noexcept {
    constexpr std::string_view names[] = {"Unique", "Set", "Map"};
    return names[static_cast<int>(type)];
}

constexpr bool is_multibinding(binding_type type) noexcept {
    return type != binding_type::unique;
}

/// Where a binding came from.
enum class binding_kind {
    injection,            // injectable constructor, synthesized by the registry
    provision,            // module provider method
    component,            // the component itself or one of its dependency instances
    component_provision,  // provision method exposed by a dependency component
    production,           // module producer method
    members_injection,
    synthetic_map         // Map<K, V> built from the Map<K, Provider<V>> contributions
};

constexpr std::string_view to_string(binding_kind kind) noexcept {
    constexpr std::string_view names[] = {
        "injection", "provision", "component", "component_provision",
        "production", "members_injection", "synthetic_map"};
    return names[static_cast<int>(kind)];
}

// ---------------------------------------------------------------
// Binding variants
// ---------------------------------------------------------------

struct provision_binding {
    libctdi::key key;
    binding_type type = binding_type::unique;
    binding_kind kind = binding_kind::provision;
    std::vector<dependency_request> dependencies;
    std::optional<std::string> scope;
    source_element element;

    /// Set for injectable types that also have members-injection sites.
    std::optional<dependency_request> members_injection_request;
};

struct production_binding {
    libctdi::key key;
    binding_type type = binding_type::unique;
    std::vector<dependency_request> dependencies;
    source_element element;
};

struct members_injection_binding {
    libctdi::key key;
    std::vector<dependency_request> injection_sites;
    source_element element;
};

/// Closed set of binding shapes.  Consumers match with std::visit so that a
/// new alternative fails to compile wherever it is not handled.
using binding = std::variant<provision_binding, production_binding, members_injection_binding>;

/// Bindings are shared and never mutated; identity (not key) distinguishes
/// two multibinding contributions with the same key.
using binding_ptr = std::shared_ptr<const binding>;

// ---------------------------------------------------------------
// Accessors common to all variants
// ---------------------------------------------------------------

LIBCTDI_EXPORT binding_key binding_key_of(const binding& b);
LIBCTDI_EXPORT binding_kind kind_of(const binding& b);
LIBCTDI_EXPORT const source_element& element_of(const binding& b);
LIBCTDI_EXPORT std::optional<std::string> scope_of(const binding& b);

/// nullopt for members-injection bindings.
LIBCTDI_EXPORT std::optional<binding_type> binding_type_of(const binding& b);

/// Declared dependencies plus any implicit members-injection request, in
/// declaration order.
LIBCTDI_EXPORT std::vector<dependency_request> implicit_dependencies_of(const binding& b);

inline bool is_contribution(const binding& b) noexcept {
    return !std::holds_alternative<members_injection_binding>(b);
}

/// Human-readable rendering used in diagnostics, e.g.
/// "@Provides app.Foo app.FooModule.provideFoo(app.Bar)".
LIBCTDI_EXPORT std::string format_binding(const binding& b);

// ---------------------------------------------------------------
// Factories
// ---------------------------------------------------------------

inline binding_ptr make_binding(provision_binding b) {
    return std::make_shared<const binding>(std::move(b));
}

inline binding_ptr make_binding(production_binding b) {
    return std::make_shared<const binding>(std::move(b));
}

inline binding_ptr make_binding(members_injection_binding b) {
    return std::make_shared<const binding>(std::move(b));
}

} // namespace libctdi
