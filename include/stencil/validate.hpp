// validate.hpp - Structural checks on a template without rendering it
#pragma once
#include "stencil/errors.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace stencil {

class Pipeline;

// Report unbalanced or mismatched blocks, malformed loop headers and unclosed tag delimiters.
// With a pipeline, module tags that no registered module declares are reported as well.
// Never throws; an empty result means the template is well formed.
std::vector<ErrorRecord> validate_template(std::string_view text, const Pipeline* pipeline = nullptr,
                                           const std::string& unit_id = {});

} // namespace stencil
