#include "libctdi/log.hpp"

#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace libctdi::log {

namespace {

std::atomic<level> g_level{level::warn};

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<sink>& active_sink() {
    static std::shared_ptr<sink> s = std::make_shared<stderr_sink>();
    return s;
}

} // anonymous namespace

void stderr_sink::write(const record& rec) {
    std::ostringstream oss;
    oss << "[libctdi] " << std::left << std::setw(5) << to_string(rec.severity)
        << ' ' << rec.module << ": " << rec.message << '\n';
    std::cerr << oss.str();
}

void set_sink(std::shared_ptr<sink> s) {
    if (!s) s = std::make_shared<stderr_sink>();
    std::lock_guard lock(sink_mutex());
    active_sink() = std::move(s);
}

void set_level(level lvl) noexcept {
    g_level.store(lvl, std::memory_order_relaxed);
}

level current_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void write(level lvl, std::string_view module, std::string message,
           const char* file, int line) {
    std::shared_ptr<sink> target;
    {
        std::lock_guard lock(sink_mutex());
        target = active_sink();
    }
    target->write(record{lvl, module, std::move(message), file, line});
}

} // namespace libctdi::log
