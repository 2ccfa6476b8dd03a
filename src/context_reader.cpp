// context_reader.cpp - EDN reader producing context values
#include "stencil/value.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace stencil
{

    namespace
    {
        struct reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 1, col = 1;
            explicit reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            char peek() const { return eof() ? '\0' : d[p]; }
            char get()
            {
                if (eof())
                    return '\0';
                char c = d[p++];
                if (c == '\n')
                {
                    ++line;
                    col = 1;
                }
                else
                {
                    ++col;
                }
                return c;
            }
            void skip_ws()
            {
                while (!eof())
                {
                    char c = peek();
                    if (c == ';')
                    {
                        while (!eof() && get() != '\n')
                            continue;
                        continue;
                    }
                    // commas are whitespace in EDN
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ',')
                    {
                        get();
                        continue;
                    }
                    break;
                }
            }
            [[noreturn]] void fail(const std::string &msg) const
            {
                throw parse_error(msg + " at line " + std::to_string(line) + ":" + std::to_string(col));
            }
        };

        bool is_digit(char c) { return c >= '0' && c <= '9'; }
        bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&'; }
        bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#' || c == ':'; }

        value_ptr parse_value(reader &);

        // Map keys are stored by name regardless of how they were written.
        std::string key_name(const value_ptr &k, reader &r)
        {
            if (auto s = as_string(*k))
                return *s;
            if (is_number(*k) || std::holds_alternative<bool>(k->data))
                return to_display_string(*k);
            r.fail("map key must be a keyword, string, symbol or number");
        }

        value_ptr parse_collection(reader &r, char end, bool tagged_set = false)
        {
            std::vector<value_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(parse_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                r.fail("unterminated collection");
            if (end != '}' || tagged_set)
                return value_seq(std::move(elems));
            if (elems.size() % 2)
                r.fail("map requires even number of forms");
            std::map<std::string, value_ptr> entries;
            for (size_t i = 0; i < elems.size(); i += 2)
                entries[key_name(elems[i], r)] = elems[i + 1];
            return value_map(std::move(entries));
        }

        value_ptr parse_string(reader &r)
        {
            if (r.get() != '"')
                r.fail("expected \"");
            std::string out;
            bool closed = false;
            while (!r.eof())
            {
                char c = r.get();
                if (c == '"')
                {
                    closed = true;
                    break;
                }
                if (c == '\\')
                {
                    if (r.eof())
                        r.fail("bad escape");
                    char e = r.get();
                    switch (e)
                    {
                    case 'n':
                        out += '\n';
                        break;
                    case 'r':
                        out += '\r';
                        break;
                    case 't':
                        out += '\t';
                        break;
                    default:
                        out += e;
                        break;
                    }
                }
                else
                    out += c;
            }
            if (!closed)
                r.fail("unterminated string");
            return v_str(std::move(out));
        }

        value_ptr parse_number(reader &r)
        {
            std::string num;
            if (r.peek() == '+' || r.peek() == '-')
                num += r.get();
            bool is_float = false;
            while (is_digit(r.peek()))
                num += r.get();
            if (r.peek() == '.')
            {
                is_float = true;
                num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            if (r.peek() == 'e' || r.peek() == 'E')
            {
                is_float = true;
                num += r.get();
                if (r.peek() == '+' || r.peek() == '-')
                    num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            try
            {
                if (is_float)
                    return v_f64(std::stod(num));
                return v_i64(static_cast<int64_t>(std::stoll(num)));
            }
            catch (const std::exception &)
            {
                r.fail("invalid number '" + num + "'");
            }
        }

        value_ptr parse_symbol_or_keyword(reader &r)
        {
            bool kw = false;
            if (r.peek() == ':')
            {
                kw = true;
                r.get();
            }
            std::string s;
            while (is_symbol_char(r.peek()))
                s += r.get();
            if (s.empty())
                r.fail("empty symbol");
            if (!kw && s == "nil")
                return v_null();
            if (!kw && s == "true")
                return v_bool(true);
            if (!kw && s == "false")
                return v_bool(false);
            return v_str(std::move(s));
        }

        value_ptr parse_value(reader &r)
        {
            r.skip_ws();
            char c = r.peek();
            switch (c)
            {
            case '"':
                return parse_string(r);
            case '(':
                r.get();
                return parse_collection(r, ')');
            case '[':
                r.get();
                return parse_collection(r, ']');
            case '{':
                r.get();
                return parse_collection(r, '}');
            case '#':
                r.get();
                if (r.peek() != '{')
                    r.fail("only #{} sets are supported in context data");
                r.get();
                return parse_collection(r, '}', true);
            default:
                break;
            }
            if (is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1])))
                return parse_number(r);
            if (c == ':' || is_symbol_start(c))
                return parse_symbol_or_keyword(r);
            if (r.eof())
                r.fail("unexpected end of input");
            r.fail(std::string("unexpected character '") + c + "'");
        }
    }

    value_ptr parse_context(std::string_view src)
    {
        reader r(src);
        r.skip_ws();
        auto v = parse_value(r);
        r.skip_ws();
        if (!r.eof())
            r.fail("unexpected trailing characters");
        return v;
    }

    std::optional<std::string> read_source_file(const std::string &path)
    {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return std::nullopt;
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

} // namespace stencil
