// options.hpp - Render configuration and its environment defaults
#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace stencil {

struct RenderOptions {
    // Escalate recoverable errors to fatal and abort the failing unit.
    bool strict = false;
    // With strict: the first fatal error abandons every unit not yet finished.
    bool abort_on_fatal = false;
    // Worker pool size for content units; 0 means one per hardware thread.
    size_t max_concurrency = 0;
    // Substitute text for null values and (lenient) missing placeholder paths.
    std::function<std::string(const std::string& path)> null_getter;
    // Print diagnostics JSON to stderr after each run.
    bool diag_json = false;
};

// True when the variable is set to 1, t, T, y or Y.
bool flag_enabled(const char* name);

// Options seeded from STENCIL_STRICT, STENCIL_ABORT_ON_FATAL, STENCIL_CONCURRENCY and STENCIL_DIAG_JSON.
RenderOptions detect_env();

// Effective pool size for `opts` (never 0).
size_t worker_count(const RenderOptions& opts);

// null_getter if set, otherwise the empty string.
std::string null_text(const RenderOptions& opts, const std::string& path);

} // namespace stencil
