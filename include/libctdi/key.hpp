#pragma once

#include "export.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace libctdi {

// ---------------------------------------------------------------
// framework_wrapper: framework type wrapping the values of a key
// ---------------------------------------------------------------

/// Framework type the front end found around the requested values, e.g.
/// the `Provider` in `Map<K, Provider<V>>`.  Bare requests carry none.
enum class framework_wrapper {
    provider,
    producer
};

constexpr std::string_view to_string(framework_wrapper w) noexcept {
    constexpr std::string_view names[] = {"Provider", "Producer"};
    return names[static_cast<int>(w)];
}

// ---------------------------------------------------------------
// key: what is requested
// ---------------------------------------------------------------

/// Identifies a requestable dependency: a type, an optional qualifier and
/// an optional framework wrapper.  Equality, ordering and hashing are
/// structural.
struct key {
    std::string type;
    std::optional<std::string> qualifier;
    std::optional<framework_wrapper> wrapper;

    key() = default;
    key(std::string type_name,
        std::optional<std::string> qualifier_name = std::nullopt,
        std::optional<framework_wrapper> framework = std::nullopt)
        : type(std::move(type_name))
        , qualifier(std::move(qualifier_name))
        , wrapper(framework)
    {}

    bool operator==(const key&) const = default;
    std::strong_ordering operator<=>(const key&) const = default;
};

/// Collection types as front ends spell them: "Set<...>" and "Map<...>".
inline bool is_set_type(std::string_view type) noexcept {
    return type.starts_with("Set<");
}

inline bool is_map_type(std::string_view type) noexcept {
    return type.starts_with("Map<");
}

/// A plain class key may be satisfied by an injectable constructor.  Keys
/// with a qualifier or wrapper, and collection keys, need an explicit
/// provider.
inline bool is_valid_implicit_provision_key(const key& k) noexcept {
    return !k.qualifier.has_value() && !k.wrapper.has_value()
        && !is_set_type(k.type) && !is_map_type(k.type);
}

LIBCTDI_EXPORT std::string to_string(const key& k);

// ---------------------------------------------------------------
// binding_key: key plus the kind of binding requested for it
// ---------------------------------------------------------------

enum class binding_key_kind {
    contribution,
    members_injection
};

constexpr std::string_view to_string(binding_key_kind kind) noexcept {
    constexpr std::string_view names[] = {"contribution", "members_injection"};
    return names[static_cast<int>(kind)];
}

struct binding_key {
    binding_key_kind kind = binding_key_kind::contribution;
    libctdi::key key;

    static binding_key contribution(libctdi::key k) {
        return binding_key{binding_key_kind::contribution, std::move(k)};
    }

    static binding_key members_injection(libctdi::key k) {
        return binding_key{binding_key_kind::members_injection, std::move(k)};
    }

    bool operator==(const binding_key&) const = default;
    std::strong_ordering operator<=>(const binding_key&) const = default;
};

LIBCTDI_EXPORT std::string to_string(const binding_key& bk);

namespace internal {

inline void hash_combine(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace internal

} // namespace libctdi

template <>
struct std::hash<libctdi::key> {
    std::size_t operator()(const libctdi::key& k) const noexcept {
        std::size_t seed = std::hash<std::string>{}(k.type);
        libctdi::internal::hash_combine(
            seed, std::hash<std::optional<std::string>>{}(k.qualifier));
        libctdi::internal::hash_combine(
            seed, std::hash<std::optional<libctdi::framework_wrapper>>{}(k.wrapper));
        return seed;
    }
};

template <>
struct std::hash<libctdi::binding_key> {
    std::size_t operator()(const libctdi::binding_key& bk) const noexcept {
        std::size_t seed = std::hash<libctdi::key>{}(bk.key);
        libctdi::internal::hash_combine(seed, static_cast<std::size_t>(bk.kind));
        return seed;
    }
};
