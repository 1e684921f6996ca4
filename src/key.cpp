#include "libctdi/key.hpp"
#include "libctdi/dependency_request.hpp"

#include <string>

namespace libctdi {

std::string to_string(const key& k) {
    std::string out;
    if (k.qualifier.has_value()) {
        out += *k.qualifier;
        out += ' ';
    }
    out += k.type;
    if (k.wrapper.has_value()) {
        out += " [";
        out += to_string(*k.wrapper);
        out += ']';
    }
    return out;
}

std::string to_string(const binding_key& bk) {
    if (bk.kind == binding_key_kind::members_injection) {
        return "members of " + to_string(bk.key);
    }
    return to_string(bk.key);
}

// ---------------------------------------------------------------
// source_element / dependency_request formatting
// ---------------------------------------------------------------

std::string to_string(const source_element& element) {
    switch (element.kind) {
        case element_kind::type:
            return element.name;
        case element_kind::method:
            return element.enclosing + "." + element.name + "()";
        case element_kind::constructor:
            return element.enclosing + "()";
        case element_kind::field:
            return element.enclosing + "." + element.name;
        case element_kind::parameter:
            return element.enclosing + "(" + element.name + ")";
    }
    return element.name;
}

std::string format_location(const source_element& element) {
    const char* file = element.location.file_name();
    if (file == nullptr || file[0] == '\0') {
        return {};
    }
    return std::string(file) + ":" + std::to_string(element.location.line());
}

std::string format_request(const dependency_request& request) {
    // Component methods hand values out; everything else receives them.
    bool provided = request.element.kind == element_kind::method
                 && request.kind != request_kind::members_injector;
    return to_string(request.key)
         + (provided ? " is provided at " : " is injected at ")
         + to_string(request.element);
}

} // namespace libctdi
