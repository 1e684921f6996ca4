#pragma once

/// @file log.hpp
/// Minimal module-tagged logging for libctdi.
///
///   LIBCTDI_LOG_DEBUG("graph", "resolved " << n << " keys for " << name);
///
/// Messages below the current level are never formatted.  Output goes to a
/// replaceable sink (stderr by default); the library is quiet (warn) unless
/// the level is lowered.

#include "export.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace libctdi::log {

enum class level {
    trace,
    debug,
    info,
    warn,
    error,
    off
};

constexpr std::string_view to_string(level lvl) noexcept {
    constexpr std::string_view names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "OFF"};
    return names[static_cast<int>(lvl)];
}

struct record {
    level severity;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
};

class LIBCTDI_EXPORT sink {
public:
    virtual ~sink() = default;
    virtual void write(const record& rec) = 0;
};

/// "[libctdi] WARN  validator: message" on stderr.
class LIBCTDI_EXPORT stderr_sink : public sink {
public:
    void write(const record& rec) override;
};

/// Replace the active sink.  nullptr restores the stderr sink.
LIBCTDI_EXPORT void set_sink(std::shared_ptr<sink> s);

LIBCTDI_EXPORT void set_level(level lvl) noexcept;
LIBCTDI_EXPORT level current_level() noexcept;

inline bool enabled(level lvl) noexcept {
    return lvl != level::off && lvl >= current_level();
}

LIBCTDI_EXPORT void write(level lvl, std::string_view module, std::string message,
                          const char* file, int line);

} // namespace libctdi::log

#define LIBCTDI_LOG(lvl, module, expr)                                              \
    do {                                                                            \
        if (::libctdi::log::enabled(lvl)) {                                         \
            std::ostringstream libctdi_log_stream_;                                 \
            libctdi_log_stream_ << expr;                                            \
            ::libctdi::log::write(lvl, module, libctdi_log_stream_.str(),           \
                                  __FILE__, __LINE__);                              \
        }                                                                           \
    } while (0)

#define LIBCTDI_LOG_TRACE(module, expr) LIBCTDI_LOG(::libctdi::log::level::trace, module, expr)
#define LIBCTDI_LOG_DEBUG(module, expr) LIBCTDI_LOG(::libctdi::log::level::debug, module, expr)
#define LIBCTDI_LOG_INFO(module, expr)  LIBCTDI_LOG(::libctdi::log::level::info, module, expr)
#define LIBCTDI_LOG_WARN(module, expr)  LIBCTDI_LOG(::libctdi::log::level::warn, module, expr)
#define LIBCTDI_LOG_ERROR(module, expr) LIBCTDI_LOG(::libctdi::log::level::error, module, expr)
