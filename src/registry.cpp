#include "libctdi/registry.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/log.hpp"
#include "registration_trace.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace libctdi {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct binding_registry::Impl {
    std::map<std::string, module_descriptor, std::less<>> modules;
    std::map<std::string, injectable_type, std::less<>> injectables;

    // Registration order matters for process_all(); the index maps a
    // type name to its position.  A deque so that find_component() results
    // survive later registrations.
    std::deque<component_descriptor> components;
    std::map<std::string, std::size_t, std::less<>> component_index;

    // Append-only caches of synthesized bindings.  Once a type has an
    // entry it is handed out unchanged for the lifetime of the registry.
    mutable std::mutex synthesis_mutex;
    std::map<std::string, binding_ptr, std::less<>> injection_bindings;
    std::map<std::string, binding_ptr, std::less<>> members_injection_bindings;

    const injectable_type* find_injectable(std::string_view type) const {
        auto it = injectables.find(type);
        return it == injectables.end() ? nullptr : &it->second;
    }
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

binding_registry::binding_registry()
    : impl_(std::make_unique<Impl>())
{}

binding_registry::~binding_registry() = default;

binding_registry::binding_registry(binding_registry&&) noexcept = default;
binding_registry& binding_registry::operator=(binding_registry&&) noexcept = default;

// ---------------------------------------------------------------
// Registration
// ---------------------------------------------------------------

binding_registry& binding_registry::add_module(module_descriptor module) {
    if (impl_->modules.contains(module.type)) {
        throw duplicate_registration("module", module.type);
    }
    for (const auto& b : module.bindings) {
        if (!b) {
            throw di_error("Module " + module.type + " declares a null binding");
        }
        if (!is_contribution(*b)) {
            throw di_error("Module " + module.type
                           + " declares a members-injection binding; modules may only"
                             " declare contribution bindings");
        }
    }
    LIBCTDI_LOG_TRACE("registry", "module " << module.type << " with "
                      << module.bindings.size() << " binding(s)");
    auto name = module.type;
    impl_->modules.emplace(std::move(name), std::move(module));
    return *this;
}

binding_registry& binding_registry::add_injectable(injectable_type type) {
    if (impl_->injectables.contains(type.type)) {
        throw duplicate_registration("injectable type", type.type);
    }
    auto name = type.type;
    impl_->injectables.emplace(std::move(name), std::move(type));
    return *this;
}

binding_registry& binding_registry::add_component(component_descriptor component) {
    if (impl_->component_index.contains(component.type)) {
        throw duplicate_registration(component.is_component ? "component" : "dependency type",
                                     component.type);
    }
    component.registration_stacktrace = internal::capture_stacktrace();
    impl_->component_index.emplace(component.type, impl_->components.size());
    impl_->components.push_back(std::move(component));
    return *this;
}

const std::deque<component_descriptor>& binding_registry::components() const {
    return impl_->components;
}

// ---------------------------------------------------------------
// Declared facts
// ---------------------------------------------------------------

const module_descriptor* binding_registry::find_module(std::string_view type) const {
    auto it = impl_->modules.find(type);
    return it == impl_->modules.end() ? nullptr : &it->second;
}

const component_descriptor* binding_registry::find_component(std::string_view type) const {
    auto it = impl_->component_index.find(type);
    return it == impl_->component_index.end() ? nullptr : &impl_->components[it->second];
}

std::vector<binding_ptr> binding_registry::declared_bindings(
        const key& k, const std::vector<std::string>& modules) const {
    std::vector<binding_ptr> result;
    for (const auto& name : modules) {
        const auto* module = find_module(name);
        if (!module) continue;
        for (const auto& b : module->bindings) {
            if (binding_key_of(*b) == binding_key::contribution(k)) {
                result.push_back(b);
            }
        }
    }
    return result;
}

bool binding_registry::has_injection_sites(std::string_view type) const {
    const auto* injectable = impl_->find_injectable(type);
    return injectable && !injectable->injection_sites.empty();
}

// ---------------------------------------------------------------
// Synthesis
// ---------------------------------------------------------------

binding_ptr binding_registry::synthesize_injectable(std::string_view type) {
    std::lock_guard lock(impl_->synthesis_mutex);
    auto cached = impl_->injection_bindings.find(type);
    if (cached != impl_->injection_bindings.end()) {
        return cached->second;
    }

    const auto* injectable = impl_->find_injectable(type);
    if (!injectable || !injectable->has_injectable_constructor) {
        return nullptr;
    }

    provision_binding b;
    b.key = key{injectable->type};
    b.type = binding_type::unique;
    b.kind = binding_kind::injection;
    b.dependencies = injectable->constructor_dependencies;
    b.scope = injectable->scope;
    b.element = constructor_element(injectable->type, injectable->location);
    if (!injectable->injection_sites.empty()) {
        b.members_injection_request = dependency_request{
            request_kind::members_injector, key{injectable->type}, b.element};
    }

    auto ptr = make_binding(std::move(b));
    impl_->injection_bindings.emplace(std::string(type), ptr);
    LIBCTDI_LOG_TRACE("registry", "synthesized injection binding for " << type);
    return ptr;
}

binding_ptr binding_registry::synthesize_members_injection(std::string_view type) {
    std::lock_guard lock(impl_->synthesis_mutex);
    auto cached = impl_->members_injection_bindings.find(type);
    if (cached != impl_->members_injection_bindings.end()) {
        return cached->second;
    }

    members_injection_binding b;
    b.key = key{std::string(type)};
    if (const auto* injectable = impl_->find_injectable(type)) {
        b.injection_sites = injectable->injection_sites;
        b.element = type_element(injectable->type, injectable->location);
    } else {
        b.element = type_element(std::string(type), {});
    }

    auto ptr = make_binding(std::move(b));
    impl_->members_injection_bindings.emplace(std::string(type), ptr);
    LIBCTDI_LOG_TRACE("registry", "synthesized members injector for " << type);
    return ptr;
}

} // namespace libctdi
