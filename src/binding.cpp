#include "libctdi/binding.hpp"
#include "overloaded.hpp"

#include <string>
#include <variant>
#include <vector>

namespace libctdi {

using internal::overloaded;

binding_key binding_key_of(const binding& b) {
    return std::visit(overloaded{
        [](const provision_binding& p) { return binding_key::contribution(p.key); },
        [](const production_binding& p) { return binding_key::contribution(p.key); },
        [](const members_injection_binding& m) { return binding_key::members_injection(m.key); },
    }, b);
}

binding_kind kind_of(const binding& b) {
    return std::visit(overloaded{
        [](const provision_binding& p) { return p.kind; },
        [](const production_binding&) { return binding_kind::production; },
        [](const members_injection_binding&) { return binding_kind::members_injection; },
    }, b);
}

const source_element& element_of(const binding& b) {
    return std::visit(overloaded{
        [](const provision_binding& p) -> const source_element& { return p.element; },
        [](const production_binding& p) -> const source_element& { return p.element; },
        [](const members_injection_binding& m) -> const source_element& { return m.element; },
    }, b);
}

std::optional<std::string> scope_of(const binding& b) {
    return std::visit(overloaded{
        [](const provision_binding& p) { return p.scope; },
        [](const production_binding&) { return std::optional<std::string>{}; },
        [](const members_injection_binding&) { return std::optional<std::string>{}; },
    }, b);
}

std::optional<binding_type> binding_type_of(const binding& b) {
    return std::visit(overloaded{
        [](const provision_binding& p) { return std::optional<binding_type>{p.type}; },
        [](const production_binding& p) { return std::optional<binding_type>{p.type}; },
        [](const members_injection_binding&) { return std::optional<binding_type>{}; },
    }, b);
}

std::vector<dependency_request> implicit_dependencies_of(const binding& b) {
    return std::visit(overloaded{
        [](const provision_binding& p) {
            auto deps = p.dependencies;
            if (p.members_injection_request.has_value()) {
                deps.push_back(*p.members_injection_request);
            }
            return deps;
        },
        [](const production_binding& p) { return p.dependencies; },
        [](const members_injection_binding& m) { return m.injection_sites; },
    }, b);
}

namespace {

std::string join_keys(const std::vector<dependency_request>& deps) {
    std::string out;
    for (std::size_t i = 0; i < deps.size(); ++i) {
        if (i > 0) out += ", ";
        out += to_string(deps[i].key);
    }
    return out;
}

std::string callable_name(const source_element& element) {
    if (element.kind == element_kind::method) {
        return element.enclosing + "." + element.name;
    }
    return element.kind == element_kind::constructor ? element.enclosing : element.name;
}

} // namespace

std::string format_binding(const binding& b) {
    return std::visit(overloaded{
        [](const provision_binding& p) -> std::string {
            switch (p.kind) {
                case binding_kind::injection:
                    return "@Inject " + callable_name(p.element)
                         + "(" + join_keys(p.dependencies) + ")";
                case binding_kind::component:
                    return "component " + to_string(p.key);
                case binding_kind::component_provision:
                    return to_string(p.key) + " " + callable_name(p.element) + "()";
                case binding_kind::synthetic_map:
                    return "synthesized " + to_string(p.key) + " from " + join_keys(p.dependencies);
                case binding_kind::provision:
                case binding_kind::production:
                case binding_kind::members_injection:
                    break;
            }
            std::string prefix = p.type == binding_type::unique
                ? "@Provides "
                : "@Provides(" + std::string(to_string(p.type)) + ") ";
            return prefix + to_string(p.key) + " " + callable_name(p.element)
                 + "(" + join_keys(p.dependencies) + ")";
        },
        [](const production_binding& p) -> std::string {
            std::string prefix = p.type == binding_type::unique
                ? "@Produces "
                : "@Produces(" + std::string(to_string(p.type)) + ") ";
            return prefix + to_string(p.key) + " " + callable_name(p.element)
                 + "(" + join_keys(p.dependencies) + ")";
        },
        [](const members_injection_binding& m) -> std::string {
            return "members injector for " + to_string(m.key);
        },
    }, b);
}

} // namespace libctdi
