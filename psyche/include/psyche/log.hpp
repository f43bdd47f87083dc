#pragma once
// Engine trace: state transitions and rejected calls, one line per entry
// on std::cerr as [HH:MM:SS.mmm][entanglement|meme|consciousness|archive] ...
// Nothing is written unless verbose mode is on (EngineConfig::verbose).

namespace psyche {

void set_verbose(bool enabled);
bool verbose();

void log_debug(const char* component, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace psyche
