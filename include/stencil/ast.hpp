// ast.hpp - Nested template tree built from the token stream
#pragma once
#include "stencil/token.hpp"
#include "stencil/errors.hpp"
#include <string>
#include <variant>
#include <vector>

namespace stencil {

struct text_node { std::string text; size_t position = 0; };
struct placeholder_node { std::string path; size_t position = 0; std::string raw; };
struct paragraph_node { std::string path; size_t position = 0; std::string raw; };
struct raw_splice_node { std::string path; size_t position = 0; std::string raw; };
struct module_tag_node { std::string name; std::string data; size_t position = 0; std::string raw; };

struct loop_node;
struct conditional_node;

using node = std::variant<text_node, placeholder_node, paragraph_node, raw_splice_node, module_tag_node, loop_node, conditional_node>;
using node_list = std::vector<node>;

struct loop_node {
    std::string var;
    std::string collection;
    node_list body;
    size_t position = 0;  // offset of the loop tag
    std::string open_raw, close_raw;
    size_t close_position = 0;
};

struct conditional_node {
    std::string expr;
    node_list then_body;
    node_list else_body;
    bool has_else = false;
    size_t position = 0;
    std::string open_raw, else_raw, close_raw;
    size_t else_position = 0, close_position = 0;
};

// Build the tree from a token stream. Throws syntax_error on unbalanced or malformed blocks.
node_list build(const std::vector<token>& tokens);

// Convenience: tokenize then build.
node_list parse_template(std::string_view text);

// Walk the tree in document order, reproducing each node's source text. For a tree built from
// tokenize(text) the result equals text.
std::string flatten(const node_list& nodes);

// Offset of the tag a node came from.
size_t position_of(const node& n);

} // namespace stencil
