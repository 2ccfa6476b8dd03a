// Serialization, equality and coercion helpers for context values.
#include "stencil/value.hpp"
#include "stencil/tag_syntax.hpp"
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace stencil {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static std::string format_double(double d){
    if(std::isnan(d)) return "NaN";
    if(std::isinf(d)) return d < 0 ? "-Infinity" : "Infinity";
    std::ostringstream oss;
    oss << std::setprecision(15) << d;
    return oss.str();
}

std::string to_json(const value& v){
    struct V {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return std::isfinite(d) ? format_double(d) : std::string("null"); }
        std::string operator()(const std::string& s) const { return json_escape(s); }
        std::string operator()(const sequence& s) const {
            std::string out = "["; bool first = true;
            for(auto& e : s.elems){ if(!first) out += ','; first = false; out += to_json(e); }
            out += ']';
            return out;
        }
        std::string operator()(const mapping& m) const {
            std::string out = "{"; bool first = true;
            for(auto& [k, e] : m.entries){ if(!first) out += ','; first = false; out += json_escape(k) + ':' + to_json(e); }
            out += '}';
            return out;
        }
    };
    return std::visit(V{}, v.data);
}

std::string to_display_string(const value& v){
    if(is_null(v)) return {};
    if(auto s = as_string(v)) return *s;
    if(std::holds_alternative<bool>(v.data)) return std::get<bool>(v.data) ? "true" : "false";
    if(std::holds_alternative<int64_t>(v.data)) return std::to_string(std::get<int64_t>(v.data));
    if(std::holds_alternative<double>(v.data)) return format_double(std::get<double>(v.data));
    return to_json(v);
}

bool equal(const value_ptr& a, const value_ptr& b){
    if(a.get() == b.get()) return true;
    if(!a || !b) return false;
    if(a->data.index() != b->data.index()) return false;
    if(auto la = as_sequence(*a)){
        auto lb = as_sequence(*b);
        if(la->elems.size() != lb->elems.size()) return false;
        for(size_t i = 0; i < la->elems.size(); ++i) if(!equal(la->elems[i], lb->elems[i])) return false;
        return true;
    }
    if(auto ma = as_mapping(*a)){
        auto mb = as_mapping(*b);
        if(ma->entries.size() != mb->entries.size()) return false;
        for(auto& [k, e] : ma->entries){
            auto it = mb->entries.find(k);
            if(it == mb->entries.end() || !equal(e, it->second)) return false;
        }
        return true;
    }
    if(is_null(*a)) return true;
    if(std::holds_alternative<bool>(a->data)) return std::get<bool>(a->data) == std::get<bool>(b->data);
    if(std::holds_alternative<int64_t>(a->data)) return std::get<int64_t>(a->data) == std::get<int64_t>(b->data);
    if(std::holds_alternative<double>(a->data)) return std::get<double>(a->data) == std::get<double>(b->data);
    return *as_string(*a) == *as_string(*b);
}

std::optional<double> as_number(const value& v){
    if(std::holds_alternative<int64_t>(v.data)) return static_cast<double>(std::get<int64_t>(v.data));
    if(std::holds_alternative<double>(v.data)) return std::get<double>(v.data);
    if(std::holds_alternative<bool>(v.data)) return std::get<bool>(v.data) ? 1.0 : 0.0;
    if(auto s = as_string(v)) return parse_number_literal(*s);
    return std::nullopt;
}

bool is_empty(const value& v){
    if(is_null(v)) return true;
    if(auto s = as_string(v)) return s->empty();
    if(auto l = as_sequence(v)) return l->elems.empty();
    if(auto m = as_mapping(v)) return m->entries.empty();
    return false;
}

bool truthy(const value& v){
    if(is_empty(v)) return false;
    if(std::holds_alternative<bool>(v.data)) return std::get<bool>(v.data);
    if(std::holds_alternative<int64_t>(v.data)) return std::get<int64_t>(v.data) != 0;
    if(std::holds_alternative<double>(v.data)){ double d = std::get<double>(v.data); return d != 0.0 && !std::isnan(d); }
    return true;
}

} // namespace stencil
