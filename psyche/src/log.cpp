#include <psyche/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>

namespace psyche {

namespace {
std::atomic<bool> verbose_mode{false};
}

void set_verbose(bool enabled) {
    verbose_mode = enabled;
}

bool verbose() {
    return verbose_mode;
}

void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    auto clock = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(clock);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);
    char prefix[64];
    size_t n = std::strftime(prefix, sizeof(prefix), "[%H:%M:%S", &local_tm);
    std::snprintf(prefix + n, sizeof(prefix) - n, ".%03lld][%s] ",
                  static_cast<long long>(millis), component);

    // Whole entry goes through std::cerr in one write
    va_list args;
    va_start(args, fmt);
    va_list sizing;
    va_copy(sizing, args);
    int len = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    std::string message(len > 0 ? static_cast<size_t>(len) : 0, '\0');
    if (len > 0) {
        std::vsnprintf(&message[0], message.size() + 1, fmt, args);
    }
    va_end(args);

    std::cerr << prefix << message << "\n";
}

} // namespace psyche
