#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "component.hpp"
#include "dependency_request.hpp"
#include "key.hpp"

#include <optional>
#include <source_location>
#include <string>
#include <utility>
#include <vector>

namespace libctdi {

/// One declared dependency of a method, constructor or field.
/// `name` becomes the parameter name in diagnostics ("arg<N>" when empty).
struct dep {
    libctdi::key key;
    request_kind kind = request_kind::instance;
    std::string name;

    dep(libctdi::key k, request_kind rk = request_kind::instance, std::string param = {})
        : key(std::move(k)), kind(rk), name(std::move(param)) {}
};

struct provides_options {
    binding_type type = binding_type::unique;
    std::optional<std::string> scope;
};

// ---------------------------------------------------------------
// module_builder
// ---------------------------------------------------------------

/// Fluent construction of a module_descriptor.  Every declaration records
/// the caller's source location for diagnostics.
///
///   auto m = module_builder("app.NetModule")
///                .provides("client", key{"app.Client"}, {key{"app.Config"}})
///                .provides_into_set("logging", key{"Set<app.Interceptor>"})
///                .build();
class LIBCTDI_EXPORT module_builder {
public:
    explicit module_builder(std::string type,
                            std::source_location loc = std::source_location::current());

    module_builder& includes(std::string module);

    module_builder& provides(std::string method, libctdi::key provided,
                             std::vector<dep> deps = {}, provides_options options = {},
                             std::source_location loc = std::source_location::current());

    module_builder& provides_into_set(std::string method, libctdi::key set_key,
                                      std::vector<dep> deps = {},
                                      std::source_location loc = std::source_location::current());

    module_builder& provides_into_map(std::string method, libctdi::key map_key,
                                      std::vector<dep> deps = {},
                                      std::source_location loc = std::source_location::current());

    module_builder& produces(std::string method, libctdi::key produced,
                             std::vector<dep> deps = {}, binding_type type = binding_type::unique,
                             std::source_location loc = std::source_location::current());

    module_descriptor build() const { return module_; }

private:
    module_descriptor module_;
};

// ---------------------------------------------------------------
// injectable_builder
// ---------------------------------------------------------------

class LIBCTDI_EXPORT injectable_builder {
public:
    explicit injectable_builder(std::string type,
                                std::source_location loc = std::source_location::current());

    injectable_builder& constructor(std::vector<dep> deps,
                                    std::source_location loc = std::source_location::current());

    injectable_builder& inject_field(std::string field, libctdi::key k,
                                     request_kind kind = request_kind::instance,
                                     std::source_location loc = std::source_location::current());

    injectable_builder& scoped(std::string scope);

    /// The type has injectable members but no injectable constructor.
    injectable_builder& members_only();

    injectable_type build() const { return type_; }

private:
    injectable_type type_;
};

// ---------------------------------------------------------------
// component_builder
// ---------------------------------------------------------------

class LIBCTDI_EXPORT component_builder {
public:
    explicit component_builder(std::string type,
                               std::source_location loc = std::source_location::current());

    component_builder& scoped(std::string scope);
    component_builder& install(std::string module);
    component_builder& depends_on(std::string dependency);

    /// Entry point returning `k` (wrapped according to `kind`).
    component_builder& provision(std::string method, libctdi::key k,
                                 request_kind kind = request_kind::instance,
                                 std::source_location loc = std::source_location::current());

    /// Entry point injecting the members of an instance of `k`.
    component_builder& members_injection(std::string method, libctdi::key k,
                                         std::source_location loc = std::source_location::current());

    /// Mark as a plain dependency type rather than a component.
    component_builder& dependency_type();

    component_descriptor build() const { return component_; }

private:
    component_descriptor component_;
};

} // namespace libctdi
