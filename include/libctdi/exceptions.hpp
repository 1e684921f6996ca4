#pragma once

#include "export.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>

namespace libctdi {

/// Base of everything libctdi throws.  User-input problems in the declared
/// model never throw; they become diagnostics in a validation_report.
class LIBCTDI_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

private:
    std::source_location location_;
    std::string diagnostic_detail_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// A component names a module or dependency the registry does not know.
class LIBCTDI_EXPORT not_found : public di_error {
public:
    not_found(std::string_view what, std::string_view name,
              std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    not_found(std::string_view what, std::string_view name, std::string_view hint,
              std::source_location loc = std::source_location::current());

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/// A module, injectable type or component was registered twice.
class LIBCTDI_EXPORT duplicate_registration : public di_error {
public:
    duplicate_registration(std::string_view what, std::string_view name,
                           std::source_location loc = std::source_location::current());

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/// The engine's own invariants were broken.  Processing of the affected
/// component must stop; this is never a problem in the user's model.
class LIBCTDI_EXPORT invariant_violation : public di_error {
public:
    explicit invariant_violation(const std::string& message,
                                 std::source_location loc = std::source_location::current());
};

/// An option was given a value outside its accepted set.
class LIBCTDI_EXPORT invalid_option : public di_error {
public:
    invalid_option(std::string_view option, std::string_view value, std::string_view accepted,
                   std::source_location loc = std::source_location::current());

    const std::string& option() const noexcept { return option_; }

private:
    std::string option_;
};

} // namespace libctdi
