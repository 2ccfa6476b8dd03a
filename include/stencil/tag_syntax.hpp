// tag_syntax.hpp - Parsers for the interior of tags (loop headers, literals, path segments)
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace stencil {

struct LoopHeader { std::string var; std::string collection; };

// Parse `VAR in PATH` (surrounding whitespace allowed). Returns nullopt when the header is malformed.
std::optional<LoopHeader> parse_loop_header(std::string_view data);

// Parse a decimal number literal (optional sign, fraction and exponent). Whole input must match.
std::optional<double> parse_number_literal(std::string_view text);

// True if the path segment is a non-negative integer index.
bool is_index_segment(std::string_view segment);

// If `text` is wrapped in matching single or double quotes, return the text inside.
std::optional<std::string> unquote(std::string_view text);

// Trim spaces, tabs, CR and LF from both ends.
std::string_view trim(std::string_view s);

} // namespace stencil
