// renderer.cpp - Placeholder substitution, loop scoping and conditional evaluation
#include "stencil/render.hpp"
#include "stencil/log.hpp"
#include "stencil/tag_syntax.hpp"
#include <cmath>

namespace stencil {

const char* to_string(HintKind k){
    switch(k){
        case HintKind::RemoveEnclosingBlock: return "RemoveEnclosingBlock";
    }
    return "?";
}

void Renderer::report(ErrorKind kind, const char* code, std::string message, std::string hint, size_t position, bool escalate){
    bool fatal = escalate && opts_.strict;
    auto rec = make_error(kind, code, std::move(message), std::move(hint), unit_id_, position,
                          fatal ? Severity::Fatal : Severity::Recoverable);
    errors_.add(rec);
    if(fatal) throw render_error(std::move(rec));
}

std::string Renderer::format(const value& v, const std::string& path) const {
    if(is_null(v)) return null_text(opts_, path);
    return to_display_string(v);
}

RenderOutput Renderer::render(const node_list& nodes, const value_ptr& ctx){
    Scope root(ctx);
    return render(nodes, root);
}

RenderOutput Renderer::render(const node_list& nodes, const Scope& scope){
    State st;
    render_nodes(nodes, scope, st);
    return RenderOutput{std::move(st.out), std::move(st.hints)};
}

void Renderer::render_nodes(const node_list& nodes, const Scope& scope, State& st){
    for(auto& n : nodes) render_node(n, scope, st);
}

void Renderer::render_placeholder(const std::string& path, size_t position, const Scope& scope, State& st){
    auto v = scope.resolve(path);
    if(!v){
        report(ErrorKind::Resolution, codes::path_not_found, "'" + path + "' not found in context",
               "add '" + path + "' to the context or fix the placeholder path", position, true);
        st.out += null_text(opts_, path);
        return;
    }
    st.out += format(*v, path);
}

void Renderer::render_loop(const loop_node& n, const Scope& scope, State& st){
    auto target = scope.resolve(n.collection);
    const sequence* seq = target ? as_sequence(*target) : nullptr;
    if(!seq){
        report(ErrorKind::Type, codes::loop_not_sequence,
               target ? "loop target '" + n.collection + "' is not a sequence" : "loop target '" + n.collection + "' not found",
               "loop over a sequence value", n.position, true);
        return;
    }
    const size_t count = seq->elems.size();
    for(size_t i = 0; i < count; ++i){
        Scope::Bindings b;
        b.emplace(n.var, seq->elems[i]);
        b.emplace("$index", v_i64(static_cast<int64_t>(i)));
        b.emplace("$first", v_bool(i == 0));
        b.emplace("$last", v_bool(i + 1 == count));
        b.emplace("$length", v_i64(static_cast<int64_t>(count)));
        Scope frame(scope, std::move(b));
        render_nodes(n.body, frame, st);
    }
}

void Renderer::render_node(const node& n, const Scope& scope, State& st){
    if(auto t = std::get_if<text_node>(&n)){ st.out += t->text; return; }
    if(auto p = std::get_if<placeholder_node>(&n)){ render_placeholder(p->path, p->position, scope, st); return; }
    if(auto p = std::get_if<paragraph_node>(&n)){
        auto v = scope.resolve(p->path);
        if(!v || is_empty(*v)){
            st.hints.push_back(StructuralHint{HintKind::RemoveEnclosingBlock, p->position, unit_id_});
            return;
        }
        st.out += format(*v, p->path);
        return;
    }
    if(auto r = std::get_if<raw_splice_node>(&n)){
        auto v = scope.resolve(r->path);
        if(v) st.out += to_display_string(*v);
        return;
    }
    if(auto m = std::get_if<module_tag_node>(&n)){ st.out += m->raw; return; }
    if(auto l = std::get_if<loop_node>(&n)){ render_loop(*l, scope, st); return; }
    if(auto c = std::get_if<conditional_node>(&n)){
        if(evaluate(c->expr, scope, c->position)) render_nodes(c->then_body, scope, st);
        else render_nodes(c->else_body, scope, st);
    }
}

// ---- conditional expressions ----

namespace {

enum class cmp_op { eq, ne, ge, le, gt, lt };

struct comparator { std::string_view text; cmp_op op; };

// Scan order matters: the first operator present wins, split at its first occurrence.
constexpr comparator comparators[] = {
    {"==", cmp_op::eq}, {"!=", cmp_op::ne}, {">=", cmp_op::ge},
    {"<=", cmp_op::le}, {">", cmp_op::gt}, {"<", cmp_op::lt},
};

value_ptr right_operand(std::string_view text, const Scope& scope){
    if(auto s = unquote(text)) return v_str(*s);
    if(auto d = parse_number_literal(text)){
        double ip = 0;
        if(std::modf(*d, &ip) == 0.0 && std::fabs(*d) < 9.0e15 && text.find_first_of(".eE") == std::string_view::npos)
            return v_i64(static_cast<int64_t>(*d));
        return v_f64(*d);
    }
    if(text == "true") return v_bool(true);
    if(text == "false") return v_bool(false);
    if(auto v = scope.resolve(text)) return v;
    return v_str(std::string(text));
}

bool is_numeric(const value& v){ return is_number(v) || std::holds_alternative<bool>(v.data); }

} // namespace

bool Renderer::evaluate(std::string_view expr, const Scope& scope, size_t position){
    expr = trim(expr);
    const comparator* found = nullptr;
    size_t at = std::string_view::npos;
    for(auto& c : comparators){
        at = expr.find(c.text);
        if(at != std::string_view::npos){ found = &c; break; }
    }
    if(!found){
        auto v = scope.resolve(expr);
        return v && truthy(*v);
    }
    auto left_path = trim(expr.substr(0, at));
    auto right_text = trim(expr.substr(at + found->text.size()));
    auto left = scope.resolve(left_path);
    if(!left) return false;
    auto right = right_operand(right_text, scope);

    auto mismatch = [&](){
        report(ErrorKind::Type, codes::incomparable_operands,
               "cannot compare '" + std::string(left_path) + "' with '" + std::string(right_text) + "'",
               "compare numbers with numbers and strings with strings", position, false);
        return false;
    };

    if(found->op == cmp_op::eq || found->op == cmp_op::ne){
        bool eq = false;
        if(is_null(*left) || is_null(*right)) eq = is_null(*left) && is_null(*right);
        else if(is_string(*left) && is_string(*right)) eq = *as_string(*left) == *as_string(*right);
        else if(is_numeric(*left) || is_numeric(*right)){
            auto a = as_number(*left), b = as_number(*right);
            if(!a || !b) return mismatch();
            eq = *a == *b;
        }
        else if((is_sequence(*left) || is_mapping(*left)) && (is_sequence(*right) || is_mapping(*right))) eq = equal(left, right);
        else return mismatch();
        return found->op == cmp_op::eq ? eq : !eq;
    }

    int c = 0;
    auto a = as_number(*left), b = as_number(*right);
    if(a && b && !is_null(*left) && !is_null(*right)){
        if(std::isnan(*a) || std::isnan(*b)) return false;
        c = *a < *b ? -1 : (*a > *b ? 1 : 0);
    }
    else if(is_string(*left) && is_string(*right)){
        int r = as_string(*left)->compare(*as_string(*right));
        c = r < 0 ? -1 : (r > 0 ? 1 : 0);
    }
    else return mismatch();

    switch(found->op){
        case cmp_op::ge: return c >= 0;
        case cmp_op::le: return c <= 0;
        case cmp_op::gt: return c > 0;
        case cmp_op::lt: return c < 0;
        default: return false;
    }
}

RenderOutput render_template(std::string_view text, const value_ptr& ctx, const RenderOptions& opts,
                             ErrorCollector& errors, const std::string& unit_id){
    auto tree = parse_template(text);
    Renderer r(opts, errors, unit_id);
    return r.render(tree, ctx);
}

} // namespace stencil
