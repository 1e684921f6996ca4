#pragma once

// Registration traces of components. Not installed.

#include "libctdi/component.hpp"
#include "libctdi/export.hpp"

#include <any>
#include <string>

namespace libctdi::internal {

/// Call stack of the caller registering a component, or an empty std::any
/// when built without Boost.Stacktrace.
LIBCTDI_LOCAL std::any capture_stacktrace();

/// "Registration stacktrace for component app.AppComponent (main.cpp:40):\n  0# ...",
/// or an empty string when the component carries no trace.
LIBCTDI_LOCAL std::string format_registration_trace(const component_descriptor& component);

} // namespace libctdi::internal
