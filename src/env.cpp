#include "stencil/options.hpp"
#include "stencil/log.hpp"
#include <cstdlib>
#include <string>
#include <thread>

namespace stencil {

bool flag_enabled(const char* name){
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

// Reads process env vars and constructs RenderOptions.
RenderOptions detect_env(){
    RenderOptions o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    o.strict = flag_enabled("STENCIL_STRICT");
    o.abort_on_fatal = flag_enabled("STENCIL_ABORT_ON_FATAL");
    o.diag_json = flag_enabled("STENCIL_DIAG_JSON");

    if(const char* v = get("STENCIL_CONCURRENCY")){
        char* end = nullptr;
        long n = std::strtol(v, &end, 10);
        if(end && *end == '\0' && n >= 1) o.max_concurrency = static_cast<size_t>(n);
        else log_line(LogLevel::Warn, "env", "ignoring STENCIL_CONCURRENCY=%s (expected a positive integer)", v);
    }
    return o;
}

size_t worker_count(const RenderOptions& opts){
    if(opts.max_concurrency) return opts.max_concurrency;
    unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 1;
}

std::string null_text(const RenderOptions& opts, const std::string& path){
    return opts.null_getter ? opts.null_getter(path) : std::string();
}

} // namespace stencil
