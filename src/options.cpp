#include "libctdi/options.hpp"
#include "libctdi/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace libctdi {

namespace {

std::string to_upper(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // anonymous namespace

scope_cycle_validation parse_scope_cycle_validation(std::string_view value) {
    auto upper = to_upper(value);
    for (auto v : {scope_cycle_validation::error, scope_cycle_validation::warning,
                   scope_cycle_validation::none}) {
        if (upper == to_string(v)) return v;
    }
    throw invalid_option(scope_validation_option, value, "ERROR, WARNING or NONE (case insensitive)");
}

validation_options validation_options_from(
        const std::map<std::string, std::string>& processor_options) {
    validation_options options;
    auto it = processor_options.find(std::string(scope_validation_option));
    if (it != processor_options.end()) {
        options.scope_hierarchy = parse_scope_cycle_validation(it->second);
    }
    return options;
}

} // namespace libctdi
