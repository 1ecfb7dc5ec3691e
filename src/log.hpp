#pragma once
#include <functional>
#include <string>

// Консольный лог: "[DBG] ...", "[INFO] ...", "[WARN] ...", "[ERR] ..."
namespace Log {

enum class Level { Debug, Info, Warn, Error };

using Sink = std::function<void(Level, const std::string&)>;

void set_debug(bool on);
bool debug_enabled();
// nullptr -> std::cout / std::cerr
void set_sink(Sink sink);

void write(Level lvl, const std::string& msg);

inline void debug(const std::string& msg) { if (debug_enabled()) write(Level::Debug, msg); }
inline void info (const std::string& msg) { write(Level::Info,  msg); }
inline void warn (const std::string& msg) { write(Level::Warn,  msg); }
inline void error(const std::string& msg) { write(Level::Error, msg); }

} // namespace Log
