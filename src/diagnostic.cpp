#include "libctdi/diagnostic.hpp"

#include <algorithm>
#include <string>

namespace libctdi {

bool validation_report::is_clean() const noexcept {
    return std::none_of(items_.begin(), items_.end(), [](const diagnostic& d) {
        return d.severity == severity_level::error;
    });
}

std::size_t validation_report::count(diagnostic_kind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(),
        [kind](const diagnostic& d) { return d.kind == kind; }));
}

void validation_report::add(diagnostic d) {
    if (std::find(items_.begin(), items_.end(), d) != items_.end()) return;
    items_.push_back(std::move(d));
}

std::string validation_report::to_string() const {
    std::string out;
    for (const auto& d : items_) {
        out += std::string(libctdi::to_string(d.severity)) + ": ["
             + std::string(libctdi::to_string(d.kind)) + "] " + d.message + "\n";
        for (const auto& element : d.elements) {
            out += "  at " + libctdi::to_string(element);
            auto where = format_location(element);
            if (!where.empty()) out += " (" + where + ")";
            out += "\n";
        }
    }
    return out;
}

} // namespace libctdi
