#pragma once

#include "export.hpp"
#include "diagnostic.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace libctdi {

/// Enforcement level of the inter-component scope chain check.  Exists so
/// that code bases reusing one scope for several lifetimes can migrate.
enum class scope_cycle_validation {
    error,
    warning,
    none
};

constexpr std::string_view to_string(scope_cycle_validation v) noexcept {
    constexpr std::string_view names[] = {"ERROR", "WARNING", "NONE"};
    return names[static_cast<int>(v)];
}

/// Severity the check reports with, or nullopt when it is disabled.
constexpr std::optional<severity_level> diagnostic_severity(scope_cycle_validation v) noexcept {
    switch (v) {
        case scope_cycle_validation::error:   return severity_level::error;
        case scope_cycle_validation::warning: return severity_level::warning;
        case scope_cycle_validation::none:    return std::nullopt;
    }
    return std::nullopt;
}

/// Case-insensitive parse of "error", "warning" or "none".
/// Throws invalid_option for anything else.
LIBCTDI_EXPORT scope_cycle_validation parse_scope_cycle_validation(std::string_view value);

// ---------------------------------------------------------------
// validation_options
// ---------------------------------------------------------------

struct validation_options {
    scope_cycle_validation scope_hierarchy = scope_cycle_validation::error;

    /// The broadest scope: a component carrying it may not depend on any
    /// scoped component.
    std::string terminal_scope = "Singleton";

    /// Maximum number of bindings listed in one duplicate-bindings message.
    std::size_t duplicate_listing_limit = 10;
};

/// Processor option controlling validation_options::scope_hierarchy.
inline constexpr std::string_view scope_validation_option =
    "libctdi.disableInterComponentScopeValidation";

/// Build validation_options from processor options ("-Akey=value" style).
/// Unknown keys are ignored; a bad value throws invalid_option.
LIBCTDI_EXPORT validation_options validation_options_from(
    const std::map<std::string, std::string>& processor_options);

// ---------------------------------------------------------------
// plan_options
// ---------------------------------------------------------------

struct plan_options {
    /// Binding keys per initialization batch.  Must be > 0.
    std::size_t batch_size = 100;
};

} // namespace libctdi
