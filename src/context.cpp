#include "stencil/context.hpp"
#include "stencil/tag_syntax.hpp"
#include <limits>

namespace stencil {

namespace {

// Split on '.', reporting false for an empty path or an empty segment.
template<typename F>
bool for_each_segment(std::string_view path, F&& fn){
    if(path.empty()) return false;
    size_t start = 0;
    while(true){
        size_t dot = path.find('.', start);
        auto seg = path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if(seg.empty()) return false;
        if(!fn(seg)) return false;
        if(dot == std::string_view::npos) return true;
        start = dot + 1;
    }
}

bool parse_index(std::string_view seg, size_t& out){
    if(!is_index_segment(seg)) return false;
    size_t v = 0;
    for(char c : seg){
        size_t d = static_cast<size_t>(c - '0');
        if(v > (std::numeric_limits<size_t>::max() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

} // namespace

value_ptr step(const value_ptr& v, std::string_view segment){
    if(!v) return nullptr;
    if(auto m = as_mapping(*v)){
        auto it = m->entries.find(std::string(segment));
        return it == m->entries.end() ? nullptr : it->second;
    }
    if(auto s = as_sequence(*v)){
        size_t i = 0;
        if(!parse_index(segment, i) || i >= s->elems.size()) return nullptr;
        return s->elems[i];
    }
    return nullptr;
}

value_ptr resolve(const value_ptr& ctx, std::string_view path){
    value_ptr cur = ctx;
    bool ok = for_each_segment(path, [&](std::string_view seg){ cur = step(cur, seg); return cur != nullptr; });
    return ok ? cur : nullptr;
}

value_ptr resolve_or(const value_ptr& ctx, std::string_view path, value_ptr fallback){
    auto v = resolve(ctx, path);
    return v ? v : fallback;
}

value_ptr Scope::binding(std::string_view name) const {
    for(const Scope* s = this; s; s = s->parent_){
        auto it = s->bindings_.find(name);
        if(it != s->bindings_.end()) return it->second;
    }
    return nullptr;
}

value_ptr Scope::resolve(std::string_view path) const {
    size_t dot = path.find('.');
    auto head = path.substr(0, dot);
    if(auto b = head.empty() ? nullptr : binding(head)){
        if(dot == std::string_view::npos) return b;
        return stencil::resolve(b, path.substr(dot + 1));
    }
    return stencil::resolve(root_, path);
}

} // namespace stencil
