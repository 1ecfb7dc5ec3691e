#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic_bool g_debug{true};
std::mutex g_mx;
Log::Sink g_sink;

const char* tag(Log::Level lvl) {
    switch (lvl) {
    case Log::Level::Debug: return "[DBG] ";
    case Log::Level::Info:  return "[INFO] ";
    case Log::Level::Warn:  return "[WARN] ";
    default:                return "[ERR] ";
    }
}
}

void Log::set_debug(bool on) { g_debug = on; }
bool Log::debug_enabled() { return g_debug; }

void Log::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lk(g_mx);
    g_sink = std::move(sink);
}

void Log::write(Level lvl, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_mx);
    if (g_sink) { g_sink(lvl, msg); return; }
    if (lvl == Level::Warn || lvl == Level::Error) std::cerr<<tag(lvl)<<msg<<"\n";
    else                                           std::cout<<tag(lvl)<<msg<<"\n";
}
