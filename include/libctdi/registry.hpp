#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "component.hpp"
#include "key.hpp"

#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace libctdi {

// ---------------------------------------------------------------
// binding_lookup: capability consumed by graph building/validation
// ---------------------------------------------------------------

/// What the graph factory and validator need from the front end's model.
/// Lookups of declared facts are read-only; the synthesize_* calls may
/// populate an append-only cache and must be safe to call concurrently.
class LIBCTDI_EXPORT binding_lookup {
public:
    virtual ~binding_lookup() = default;

    virtual const module_descriptor* find_module(std::string_view type) const = 0;
    virtual const component_descriptor* find_component(std::string_view type) const = 0;

    /// Contribution bindings for `k` declared by any of `modules`, in module
    /// order, then declaration order within each module.
    virtual std::vector<binding_ptr> declared_bindings(
        const key& k, const std::vector<std::string>& modules) const = 0;

    /// The injection binding for `type`, or nullptr when the type has no
    /// injectable constructor.  Repeated calls return the same object.
    virtual binding_ptr synthesize_injectable(std::string_view type) = 0;

    /// The members-injection binding for `type`.  Types never declared
    /// injectable get a binding without injection sites.  Repeated calls
    /// return the same object.
    virtual binding_ptr synthesize_members_injection(std::string_view type) = 0;

    /// True when `type` was declared with at least one injection site.
    virtual bool has_injection_sites(std::string_view type) const = 0;
};

// ---------------------------------------------------------------
// binding_registry
// ---------------------------------------------------------------

/// Holds everything the front end declared and lazily synthesizes implicit
/// bindings.  Register every fact first, then share the registry with any
/// number of graph builds (possibly on different threads).
class LIBCTDI_EXPORT binding_registry : public binding_lookup {
public:
    binding_registry();
    ~binding_registry() override;

    binding_registry(const binding_registry&) = delete;
    binding_registry& operator=(const binding_registry&) = delete;
    binding_registry(binding_registry&&) noexcept;
    binding_registry& operator=(binding_registry&&) noexcept;

    /// Throws duplicate_registration if a module of the same type exists,
    /// di_error if the module declares a members-injection binding.
    binding_registry& add_module(module_descriptor module);

    /// Throws duplicate_registration if the type was already declared.
    binding_registry& add_injectable(injectable_type type);

    /// Throws duplicate_registration if a descriptor of the same type exists.
    binding_registry& add_component(component_descriptor component);

    /// Components and dependency types in registration order.  Elements
    /// keep their address when more components are registered.
    const std::deque<component_descriptor>& components() const;

    const module_descriptor* find_module(std::string_view type) const override;
    const component_descriptor* find_component(std::string_view type) const override;

    std::vector<binding_ptr> declared_bindings(
        const key& k, const std::vector<std::string>& modules) const override;

    binding_ptr synthesize_injectable(std::string_view type) override;
    binding_ptr synthesize_members_injection(std::string_view type) override;
    bool has_injection_sites(std::string_view type) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace libctdi
