#include "stencil/log.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace stencil {

namespace {
std::atomic<int> g_level{-1};
std::mutex g_write_mu; // keeps lines from concurrent workers whole

LogLevel level_from_env(){
    const char* v = std::getenv("STENCIL_LOG");
    return (v && *v) ? parse_log_level(v, LogLevel::Warn) : LogLevel::Warn;
}
}

LogLevel parse_log_level(std::string_view name, LogLevel fallback){
    if(name == "debug") return LogLevel::Debug;
    if(name == "info") return LogLevel::Info;
    if(name == "warn" || name == "warning") return LogLevel::Warn;
    if(name == "error") return LogLevel::Error;
    if(name == "off" || name == "none") return LogLevel::Off;
    return fallback;
}

LogLevel log_level(){
    int l = g_level.load(std::memory_order_relaxed);
    if(l < 0){
        l = static_cast<int>(level_from_env());
        int expected = -1;
        if(!g_level.compare_exchange_strong(expected, l)) l = expected;
    }
    return static_cast<LogLevel>(l);
}

void set_log_level(LogLevel l){ g_level.store(static_cast<int>(l)); }

bool log_enabled(LogLevel l){ return l != LogLevel::Off && static_cast<int>(l) >= static_cast<int>(log_level()); }

const char* to_string(LogLevel l){
    switch(l){
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "?";
}

void log_line(LogLevel level, const char* component, const char* fmt, ...){
    if(!log_enabled(level)) return;
    std::lock_guard<std::mutex> lk(g_write_mu);
    std::fprintf(stderr, "[stencil][%s][%s] ", to_string(level), component);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fputc('\n', stderr);
}

} // namespace stencil
