#pragma once

#include "export.hpp"
#include "dependency_request.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace libctdi {

enum class severity_level {
    error,
    warning
};

constexpr std::string_view to_string(severity_level s) noexcept {
    constexpr std::string_view names[] = {"error", "warning"};
    return names[static_cast<int>(s)];
}

enum class diagnostic_kind {
    missing_binding,
    duplicate_bindings,
    multiple_binding_types,
    dependency_cycle,
    scope_mismatch,
    scope_hierarchy_violation
};

constexpr std::string_view to_string(diagnostic_kind kind) noexcept {
    constexpr std::string_view names[] = {
        "MISSING_BINDING", "DUPLICATE_BINDINGS", "MULTIPLE_BINDING_TYPES",
        "DEPENDENCY_CYCLE", "SCOPE_MISMATCH", "SCOPE_HIERARCHY_VIOLATION"};
    return names[static_cast<int>(kind)];
}

struct diagnostic {
    severity_level severity = severity_level::error;
    diagnostic_kind kind = diagnostic_kind::missing_binding;
    std::string message;

    /// Offending declarations, most relevant first.
    std::vector<source_element> elements;

    bool operator==(const diagnostic&) const = default;
};

/// Accumulated outcome of validating one binding graph.
class LIBCTDI_EXPORT validation_report {
public:
    explicit validation_report(std::string subject) : subject_(std::move(subject)) {}

    /// The component type the report is about.
    const std::string& subject() const noexcept { return subject_; }

    const std::vector<diagnostic>& items() const noexcept { return items_; }

    /// True when no item has error severity.  Warnings keep a report clean.
    bool is_clean() const noexcept;

    std::size_t count(diagnostic_kind kind) const noexcept;

    /// Append `d` unless an identical diagnostic was already reported.
    void add(diagnostic d);

    /// Multi-line rendering, one block per item:
    ///   error: [MISSING_BINDING] app.Foo cannot be provided ...
    ///     at app.AppComponent.foo() (main.cpp:12)
    std::string to_string() const;

private:
    std::string subject_;
    std::vector<diagnostic> items_;
};

} // namespace libctdi
