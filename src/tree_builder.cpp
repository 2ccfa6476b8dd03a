// tree_builder.cpp - Stack-based construction of nested loop / conditional subtrees
#include "stencil/ast.hpp"

namespace stencil {

namespace {

struct frame {
    bool is_loop = false;
    loop_node loop;
    conditional_node cond;
    bool in_else = false;

    node_list& body(){
        if(is_loop) return loop.body;
        return in_else ? cond.else_body : cond.then_body;
    }
    size_t position() const { return is_loop ? loop.position : cond.position; }
};

const char* block_name(const frame& f){ return f.is_loop ? "loop" : "if"; }

} // namespace

node_list build(const std::vector<token>& tokens){
    node_list root;
    std::vector<frame> stack;
    auto target = [&]() -> node_list& { return stack.empty() ? root : stack.back().body(); };

    for(const auto& t : tokens){
        switch(t.kind){
            case token_kind::text:
                target().push_back(text_node{t.raw, t.start});
                break;
            case token_kind::placeholder:
                target().push_back(placeholder_node{t.path, t.start, t.raw});
                break;
            case token_kind::paragraph_placeholder:
                target().push_back(paragraph_node{t.path, t.start, t.raw});
                break;
            case token_kind::raw_splice:
                target().push_back(raw_splice_node{t.path, t.start, t.raw});
                break;
            case token_kind::module_tag:
                target().push_back(module_tag_node{t.name, t.data, t.start, t.raw});
                break;
            case token_kind::loop_start: {
                if(!t.well_formed)
                    throw syntax_error(codes::malformed_loop_header, "malformed loop header '" + t.data + "'", t.start);
                frame f; f.is_loop = true;
                f.loop.var = t.var; f.loop.collection = t.path;
                f.loop.position = t.start; f.loop.open_raw = t.raw;
                stack.push_back(std::move(f));
                break;
            }
            case token_kind::cond_if: {
                frame f;
                f.cond.expr = t.expr; f.cond.position = t.start; f.cond.open_raw = t.raw;
                stack.push_back(std::move(f));
                break;
            }
            case token_kind::cond_else: {
                if(stack.empty() || stack.back().is_loop)
                    throw syntax_error(codes::misplaced_else, "else outside of an if block", t.start);
                auto& f = stack.back();
                if(f.in_else)
                    throw syntax_error(codes::misplaced_else, "second else in if block", t.start);
                f.in_else = true;
                f.cond.has_else = true;
                f.cond.else_raw = t.raw; f.cond.else_position = t.start;
                break;
            }
            case token_kind::loop_end:
            case token_kind::cond_end: {
                bool want_loop = t.kind == token_kind::loop_end;
                const char* tag = want_loop ? "endloop" : "endif";
                if(stack.empty())
                    throw syntax_error(codes::block_end_without_open, std::string(tag) + " with no open block", t.start);
                if(stack.back().is_loop != want_loop)
                    throw syntax_error(codes::block_end_mismatch,
                        std::string(tag) + " does not match open " + block_name(stack.back()) + " block", t.start);
                frame f = std::move(stack.back());
                stack.pop_back();
                if(f.is_loop){
                    f.loop.close_raw = t.raw; f.loop.close_position = t.start;
                    target().push_back(std::move(f.loop));
                } else {
                    f.cond.close_raw = t.raw; f.cond.close_position = t.start;
                    target().push_back(std::move(f.cond));
                }
                break;
            }
        }
    }
    if(!stack.empty()){
        const auto& f = stack.back();
        throw syntax_error(codes::unterminated_block, std::string("unterminated ") + block_name(f) + " block", f.position());
    }
    return root;
}

node_list parse_template(std::string_view text){ return build(tokenize(text)); }

namespace {

void flatten_into(const node_list& nodes, std::string& out);

struct flattener {
    std::string& out;
    void operator()(const text_node& n) const { out += n.text; }
    void operator()(const placeholder_node& n) const { out += n.raw; }
    void operator()(const paragraph_node& n) const { out += n.raw; }
    void operator()(const raw_splice_node& n) const { out += n.raw; }
    void operator()(const module_tag_node& n) const { out += n.raw; }
    void operator()(const loop_node& n) const { out += n.open_raw; flatten_into(n.body, out); out += n.close_raw; }
    void operator()(const conditional_node& n) const {
        out += n.open_raw; flatten_into(n.then_body, out);
        if(n.has_else){ out += n.else_raw; flatten_into(n.else_body, out); }
        out += n.close_raw;
    }
};

void flatten_into(const node_list& nodes, std::string& out){
    for(auto& n : nodes) std::visit(flattener{out}, n);
}

} // namespace

std::string flatten(const node_list& nodes){
    std::string out;
    flatten_into(nodes, out);
    return out;
}

size_t position_of(const node& n){
    return std::visit([](const auto& x){ return x.position; }, n);
}

} // namespace stencil
