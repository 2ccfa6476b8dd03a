// token.hpp - Tag tokenizer producing a gap-free token stream
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stencil
{

    enum class token_kind
    {
        text,
        placeholder,           // {{ path }}
        paragraph_placeholder, // {{? path }}
        raw_splice,            // {@ path }
        loop_start,            // {% loop VAR in PATH %}
        loop_end,              // {% endloop %}
        cond_if,               // {% if EXPR %}
        cond_else,             // {% else %}
        cond_end,              // {% endif %}
        module_tag             // {% NAME DATA %}
    };

    struct token
    {
        token_kind kind = token_kind::text;
        size_t start = 0; // raw span [start, end) in the scanned input
        size_t end = 0;
        std::string raw;  // exact source text of the span

        std::string path; // placeholder / paragraph / raw splice path, loop collection path
        std::string var;  // loop variable
        std::string expr; // conditional expression
        std::string name; // module tag name
        std::string data; // module tag data, or the unparsed loop header

        bool well_formed = true; // false for loop headers that are not `VAR in PATH`
    };

    // Scan `text` left to right. Never throws; the concatenation of all raw spans equals `text`.
    // An opening delimiter with no closing delimiter turns the remainder of the input into text.
    std::vector<token> tokenize(std::string_view text);

    // Reassemble the original input from a token stream.
    std::string join_raw(const std::vector<token> &tokens);

    const char *to_string(token_kind k);

    // Tag delimiters
    inline constexpr std::string_view raw_open = "{@";
    inline constexpr std::string_view raw_close = "}";
    inline constexpr std::string_view paragraph_open = "{{?";
    inline constexpr std::string_view block_open = "{%";
    inline constexpr std::string_view block_close = "%}";
    inline constexpr std::string_view placeholder_open = "{{";
    inline constexpr std::string_view placeholder_close = "}}";

} // namespace stencil
