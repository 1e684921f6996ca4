#include "libctdi/builders.hpp"

#include <string>
#include <utility>
#include <vector>

namespace libctdi {

namespace {

// Parameters are named after the callable that declares them so that a
// dependency path reads "app.Bar is injected at app.FooModule.provideFoo(bar)".
std::vector<dependency_request> make_requests(const std::string& callable,
                                              std::vector<dep> deps,
                                              std::source_location loc) {
    std::vector<dependency_request> requests;
    requests.reserve(deps.size());
    for (std::size_t i = 0; i < deps.size(); ++i) {
        auto& d = deps[i];
        std::string name = d.name.empty() ? "arg" + std::to_string(i) : std::move(d.name);
        requests.push_back(dependency_request{
            d.kind, std::move(d.key), parameter_element(callable, std::move(name), loc)});
    }
    return requests;
}

} // namespace

// ---------------------------------------------------------------
// module_builder
// ---------------------------------------------------------------

module_builder::module_builder(std::string type, std::source_location loc) {
    module_.type = std::move(type);
    module_.location = loc;
}

module_builder& module_builder::includes(std::string module) {
    module_.includes.push_back(std::move(module));
    return *this;
}

module_builder& module_builder::provides(std::string method, libctdi::key provided,
                                         std::vector<dep> deps, provides_options options,
                                         std::source_location loc) {
    provision_binding b;
    b.key = std::move(provided);
    b.type = options.type;
    b.kind = binding_kind::provision;
    b.dependencies = make_requests(module_.type + "." + method, std::move(deps), loc);
    b.scope = std::move(options.scope);
    b.element = method_element(module_.type, std::move(method), loc);
    module_.bindings.push_back(make_binding(std::move(b)));
    return *this;
}

module_builder& module_builder::provides_into_set(std::string method, libctdi::key set_key,
                                                  std::vector<dep> deps,
                                                  std::source_location loc) {
    return provides(std::move(method), std::move(set_key), std::move(deps),
                    provides_options{.type = binding_type::set}, loc);
}

module_builder& module_builder::provides_into_map(std::string method, libctdi::key map_key,
                                                  std::vector<dep> deps,
                                                  std::source_location loc) {
    return provides(std::move(method), std::move(map_key), std::move(deps),
                    provides_options{.type = binding_type::map}, loc);
}

module_builder& module_builder::produces(std::string method, libctdi::key produced,
                                         std::vector<dep> deps, binding_type type,
                                         std::source_location loc) {
    production_binding b;
    b.key = std::move(produced);
    b.type = type;
    b.dependencies = make_requests(module_.type + "." + method, std::move(deps), loc);
    b.element = method_element(module_.type, std::move(method), loc);
    module_.bindings.push_back(make_binding(std::move(b)));
    return *this;
}

// ---------------------------------------------------------------
// injectable_builder
// ---------------------------------------------------------------

injectable_builder::injectable_builder(std::string type, std::source_location loc) {
    type_.type = std::move(type);
    type_.location = loc;
}

injectable_builder& injectable_builder::constructor(std::vector<dep> deps,
                                                    std::source_location loc) {
    type_.constructor_dependencies = make_requests(type_.type, std::move(deps), loc);
    type_.has_injectable_constructor = true;
    return *this;
}

injectable_builder& injectable_builder::inject_field(std::string field, libctdi::key k,
                                                     request_kind kind,
                                                     std::source_location loc) {
    type_.injection_sites.push_back(dependency_request{
        kind, std::move(k), field_element(type_.type, std::move(field), loc)});
    return *this;
}

injectable_builder& injectable_builder::scoped(std::string scope) {
    type_.scope = std::move(scope);
    return *this;
}

injectable_builder& injectable_builder::members_only() {
    type_.has_injectable_constructor = false;
    type_.constructor_dependencies.clear();
    return *this;
}

// ---------------------------------------------------------------
// component_builder
// ---------------------------------------------------------------

component_builder::component_builder(std::string type, std::source_location loc) {
    component_.type = std::move(type);
    component_.location = loc;
}

component_builder& component_builder::scoped(std::string scope) {
    component_.scope = std::move(scope);
    return *this;
}

component_builder& component_builder::install(std::string module) {
    component_.modules.push_back(std::move(module));
    return *this;
}

component_builder& component_builder::depends_on(std::string dependency) {
    component_.dependencies.push_back(std::move(dependency));
    return *this;
}

component_builder& component_builder::provision(std::string method, libctdi::key k,
                                                request_kind kind,
                                                std::source_location loc) {
    component_.entry_points.push_back(dependency_request{
        kind, std::move(k), method_element(component_.type, std::move(method), loc)});
    return *this;
}

component_builder& component_builder::members_injection(std::string method, libctdi::key k,
                                                        std::source_location loc) {
    component_.entry_points.push_back(dependency_request{
        request_kind::members_injector, std::move(k),
        method_element(component_.type, std::move(method), loc)});
    return *this;
}

component_builder& component_builder::dependency_type() {
    component_.is_component = false;
    return *this;
}

} // namespace libctdi
