#pragma once

#include "export.hpp"
#include "key.hpp"

#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace libctdi {

// ---------------------------------------------------------------
// source_element: syntactic site reported by the front end
// ---------------------------------------------------------------

enum class element_kind {
    type,
    method,
    constructor,
    field,
    parameter
};

/// A declaration the front end attributes a fact to.  Only used for
/// diagnostics; never part of key or binding identity.
///
///   type         name = "app.Foo"
///   method       enclosing = "app.FooModule", name = "provideFoo"
///   constructor  enclosing = name = "app.Foo"
///   field        enclosing = "app.Foo", name = "bar"
///   parameter    enclosing = "app.FooModule.provideFoo", name = "bar"
struct source_element {
    element_kind kind = element_kind::type;
    std::string enclosing;
    std::string name;
    std::source_location location = {};

    bool operator==(const source_element& o) const noexcept {
        return kind == o.kind && enclosing == o.enclosing && name == o.name;
    }
};

LIBCTDI_EXPORT std::string to_string(const source_element& element);

/// "file:line" of the declaration, or empty when none was recorded.
LIBCTDI_EXPORT std::string format_location(const source_element& element);

inline source_element type_element(std::string type,
                                   std::source_location loc = std::source_location::current()) {
    return {element_kind::type, {}, std::move(type), loc};
}

inline source_element method_element(std::string enclosing, std::string name,
                                     std::source_location loc = std::source_location::current()) {
    return {element_kind::method, std::move(enclosing), std::move(name), loc};
}

inline source_element constructor_element(std::string type,
                                          std::source_location loc = std::source_location::current()) {
    return {element_kind::constructor, type, type, loc};
}

inline source_element field_element(std::string enclosing, std::string name,
                                    std::source_location loc = std::source_location::current()) {
    return {element_kind::field, std::move(enclosing), std::move(name), loc};
}

inline source_element parameter_element(std::string enclosing, std::string name,
                                        std::source_location loc = std::source_location::current()) {
    return {element_kind::parameter, std::move(enclosing), std::move(name), loc};
}

// ---------------------------------------------------------------
// dependency_request: one edge of the graph
// ---------------------------------------------------------------

enum class request_kind {
    instance,
    lazy,
    provider,
    producer,
    produced,
    members_injector
};

constexpr std::string_view to_string(request_kind kind) noexcept {
    constexpr std::string_view names[] = {
        "instance", "lazy", "provider", "producer", "produced", "members_injector"};
    return names[static_cast<int>(kind)];
}

struct dependency_request {
    request_kind kind = request_kind::instance;
    libctdi::key key;
    source_element element;

    bool operator==(const dependency_request&) const = default;
};

/// The binding key a request resolves to: members-injector requests need a
/// members-injection binding, everything else a contribution.
inline binding_key binding_key_for(const dependency_request& request) {
    return request.kind == request_kind::members_injector
        ? binding_key::members_injection(request.key)
        : binding_key::contribution(request.key);
}

/// One line of a dependency path, e.g. "app.Bar is injected at app.Foo(bar)".
LIBCTDI_EXPORT std::string format_request(const dependency_request& request);

} // namespace libctdi
