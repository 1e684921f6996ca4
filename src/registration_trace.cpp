#include "registration_trace.hpp"

#include <any>
#include <cstddef>
#include <sstream>

#ifdef LIBCTDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libctdi::internal {

namespace {

#ifdef LIBCTDI_HAS_STACKTRACE
// capture_stacktrace() and binding_registry::add_component()
constexpr std::size_t library_frames = 2;
constexpr std::size_t max_frames = 32;
#endif

} // anonymous namespace

std::any capture_stacktrace() {
#ifdef LIBCTDI_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace(library_frames, max_frames));
#else
    return {};
#endif
}

std::string format_registration_trace(const component_descriptor& component) {
    std::ostringstream trace;
#ifdef LIBCTDI_HAS_STACKTRACE
    const auto* frames =
        std::any_cast<boost::stacktrace::stacktrace>(&component.registration_stacktrace);
    if (!frames || frames->empty()) return {};
    trace << *frames;
#else
    if (!component.registration_stacktrace.has_value()) return {};
#endif

    std::string header = "Registration stacktrace for "
                         + std::string(component.is_component ? "component " : "dependency ")
                         + component.type;
    auto where = format_location(component.element());
    if (!where.empty()) {
        header += " (" + where + ")";
    }
    return header + ":\n" + trace.str();
}

} // namespace libctdi::internal
