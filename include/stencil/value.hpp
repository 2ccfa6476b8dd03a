// value.hpp - Immutable context values (scalars, sequences, mappings) shared by reference
#pragma once
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace stencil
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct value; // forward declaration

    // Values are never mutated once built; a snapshot can be shared across threads.
    using value_ptr = std::shared_ptr<const value>;

    struct sequence
    {
        std::vector<value_ptr> elems;
    };
    struct mapping
    {
        std::map<std::string, value_ptr> entries;
    };

    using value_data = std::variant<std::monostate, bool, int64_t, double, std::string, sequence, mapping>;

    struct value
    {
        value_data data;
    };

    // Read a single EDN form into a context value.
    // Maps become mappings (keyword/string/symbol/number keys stored by name), vectors, lists
    // and sets become sequences, keywords and symbols become strings, nil becomes null.
    value_ptr parse_context(std::string_view src);

    // Whole contents of a template or context file; nullopt when it cannot be opened.
    // An empty file yields an empty string.
    std::optional<std::string> read_source_file(const std::string &path);

    // Compact JSON serialization (used when a placeholder resolves to a collection).
    std::string to_json(const value &v);
    inline std::string to_json(const value_ptr &p) { return p ? to_json(*p) : std::string("null"); }

    // Escape a string for safe JSON output (quotes included).
    std::string json_escape(const std::string &s);

    // Scalar text form: strings verbatim, numbers in decimal, booleans as true/false.
    // Null yields an empty string; collections fall back to to_json.
    std::string to_display_string(const value &v);

    // Structural deep equality.
    bool equal(const value_ptr &a, const value_ptr &b);

    inline bool is_null(const value &v) { return std::holds_alternative<std::monostate>(v.data); }
    inline bool is_string(const value &v) { return std::holds_alternative<std::string>(v.data); }
    inline bool is_sequence(const value &v) { return std::holds_alternative<sequence>(v.data); }
    inline bool is_mapping(const value &v) { return std::holds_alternative<mapping>(v.data); }
    inline bool is_number(const value &v) { return std::holds_alternative<int64_t>(v.data) || std::holds_alternative<double>(v.data); }
    inline const sequence *as_sequence(const value &v) { return is_sequence(v) ? &std::get<sequence>(v.data) : nullptr; }
    inline const mapping *as_mapping(const value &v) { return is_mapping(v) ? &std::get<mapping>(v.data) : nullptr; }
    inline const std::string *as_string(const value &v) { return is_string(v) ? &std::get<std::string>(v.data) : nullptr; }

    // Numeric view used by comparisons: numbers as-is, booleans as 0/1, numeric strings parsed.
    std::optional<double> as_number(const value &v);

    // Empty means null, empty string, empty sequence or empty mapping.
    bool is_empty(const value &v);

    // Truthiness: non-null, non-empty, non-zero and non-false.
    bool truthy(const value &v);

    namespace detail
    {
        inline value_ptr make_value(value_data d) { return std::make_shared<const value>(value{std::move(d)}); }
    }

    // ------ Factory helpers ------

    inline value_ptr v_null() { return detail::make_value(std::monostate{}); }
    inline value_ptr v_bool(bool b) { return detail::make_value(b); }
    inline value_ptr v_i64(int64_t i) { return detail::make_value(i); }
    inline value_ptr v_f64(double d) { return detail::make_value(d); }
    inline value_ptr v_str(std::string s) { return detail::make_value(std::move(s)); }

    inline value_ptr value_seq() { return detail::make_value(sequence{}); }
    inline value_ptr value_seq(std::initializer_list<value_ptr> xs)
    {
        sequence s;
        s.elems.assign(xs.begin(), xs.end());
        return detail::make_value(std::move(s));
    }
    inline value_ptr value_seq(std::vector<value_ptr> xs) { return detail::make_value(sequence{std::move(xs)}); }

    inline value_ptr value_map() { return detail::make_value(mapping{}); }
    inline value_ptr value_map(std::initializer_list<std::pair<const std::string, value_ptr>> xs)
    {
        mapping m;
        m.entries.insert(xs.begin(), xs.end());
        return detail::make_value(std::move(m));
    }
    inline value_ptr value_map(std::map<std::string, value_ptr> xs) { return detail::make_value(mapping{std::move(xs)}); }

    inline std::pair<const std::string, value_ptr> kv(std::string k, value_ptr v) { return {std::move(k), std::move(v)}; }

} // namespace stencil
