#include "stencil/tag_syntax.hpp"
#include "grammar.hpp"
#include <cstdlib>
#include <string>
#include <tao/pegtl.hpp>

namespace stencil {

namespace actions {
using namespace tao::pegtl;

template<typename Rule>
struct header_action : nothing<Rule> {};

template<> struct header_action< grammar::loop_var > {
    template<typename Input>
    static void apply(const Input& in, LoopHeader& h){ h.var = in.string(); }
};

template<> struct header_action< grammar::collection_path > {
    template<typename Input>
    static void apply(const Input& in, LoopHeader& h){ h.collection = in.string(); }
};

} // namespace actions

std::optional<LoopHeader> parse_loop_header(std::string_view data){
    tao::pegtl::memory_input<> in(data.data(), data.size(), "loop-header");
    LoopHeader h;
    if(!tao::pegtl::parse< grammar::loop_header, actions::header_action >(in, h)) return std::nullopt;
    return h;
}

std::optional<double> parse_number_literal(std::string_view text){
    tao::pegtl::memory_input<> in(text.data(), text.size(), "number");
    if(!tao::pegtl::parse< grammar::number_literal >(in)) return std::nullopt;
    // strtod needs a terminated buffer
    std::string buf(text);
    return std::strtod(buf.c_str(), nullptr);
}

bool is_index_segment(std::string_view segment){
    tao::pegtl::memory_input<> in(segment.data(), segment.size(), "segment");
    return tao::pegtl::parse< grammar::index_segment >(in);
}

std::optional<std::string> unquote(std::string_view text){
    if(text.size() < 2) return std::nullopt;
    char q = text.front();
    if((q != '"' && q != '\'') || text.back() != q) return std::nullopt;
    return std::string(text.substr(1, text.size() - 2));
}

std::string_view trim(std::string_view s){
    size_t b = s.find_first_not_of(" \t\r\n");
    if(b == std::string_view::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace stencil
