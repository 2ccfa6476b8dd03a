// diagnostics_json.hpp - JSON serialization for render diagnostics
#pragma once
#include "stencil/pipeline.hpp"
#include <string>
#include <vector>

namespace stencil {

// Serialize error records to a compact JSON array.
std::string errors_to_json(const std::vector<ErrorRecord>& errors);

// Serialize a run's success flag, errors and structural hints to a compact JSON object.
std::string diagnostics_to_json(const RenderResult& r);

// If `force` or STENCIL_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const RenderResult& r, bool force = false);

} // namespace stencil
