#include "libctdi/exceptions.hpp"

#include <string>
#include <string_view>

namespace libctdi {

std::string di_error::format_message(const std::string& msg,
                                     const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

not_found::not_found(std::string_view what, std::string_view name,
                     std::source_location loc)
    : di_error("Unknown " + std::string(what) + ": " + std::string(name), loc)
    , name_(name)
{}

not_found::not_found(std::string_view what, std::string_view name,
                     std::string_view hint, std::source_location loc)
    : di_error([&]() {
          std::string msg = "Unknown " + std::string(what) + ": " + std::string(name);
          if (!hint.empty())
              msg += "; " + std::string(hint);
          return msg;
      }(), loc)
    , name_(name)
{}

duplicate_registration::duplicate_registration(std::string_view what,
                                               std::string_view name,
                                               std::source_location loc)
    : di_error("Duplicate registration of " + std::string(what) + ": " + std::string(name), loc)
    , name_(name)
{}

invariant_violation::invariant_violation(const std::string& message,
                                         std::source_location loc)
    : di_error("Internal invariant violated: " + message, loc)
{}

invalid_option::invalid_option(std::string_view option, std::string_view value,
                               std::string_view accepted, std::source_location loc)
    : di_error("Invalid value \"" + std::string(value) + "\" for option "
               + std::string(option) + "; expected " + std::string(accepted), loc)
    , option_(option)
{}

} // namespace libctdi
