#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "dependency_request.hpp"

#include <any>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

namespace libctdi {

// ---------------------------------------------------------------
// module_descriptor: a declared factory of contribution bindings
// ---------------------------------------------------------------

struct module_descriptor {
    std::string type;
    std::vector<std::string> includes;
    std::vector<binding_ptr> bindings;
    std::source_location location = {};
};

// ---------------------------------------------------------------
// injectable_type: a type the registry may bind implicitly
// ---------------------------------------------------------------

/// A type whose constructor (and/or members) the front end marked for
/// injection.  The registry turns it into bindings only when some graph
/// asks for it.
struct injectable_type {
    std::string type;
    std::vector<dependency_request> constructor_dependencies;
    std::vector<dependency_request> injection_sites;
    std::optional<std::string> scope;

    /// False for types that only have injectable members; those can be
    /// members-injected but never implicitly provided.
    bool has_injectable_constructor = true;

    std::source_location location = {};
};

// ---------------------------------------------------------------
// component_descriptor: the declared shape of one component
// ---------------------------------------------------------------

struct component_descriptor {
    std::string type;
    std::optional<std::string> scope;
    std::vector<std::string> modules;

    /// Names of other registered descriptors this component depends on.
    std::vector<std::string> dependencies;

    /// Component methods.  For dependency components these double as the
    /// provision methods exposed to dependants.
    std::vector<dependency_request> entry_points;

    /// False for plain dependency types: they expose provision methods but
    /// get no graph of their own and do not extend scope chains.
    bool is_component = true;

    std::source_location location = {};

    /// Stacktrace captured by the registry when the descriptor was added.
    std::any registration_stacktrace;

    source_element element() const {
        return {element_kind::type, {}, type, location};
    }
};

} // namespace libctdi
