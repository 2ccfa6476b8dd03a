#include "stencil/module.hpp"

namespace stencil {

void RenderEnv::report(std::string code, std::string message, std::string hint, std::optional<size_t> position) const {
    auto rec = make_error(ErrorKind::Module, std::move(code), module_name.empty() ? std::move(message) : module_name + ": " + message,
                          std::move(hint), unit_id, position, options.strict ? Severity::Fatal : Severity::Recoverable);
    if(options.strict){
        errors.add(rec);
        throw render_error(std::move(rec));
    }
    errors.add(std::move(rec));
}

bool Module::should_process(std::string_view text, const std::string& file_type, const ModuleDescriptor& d) const {
    return default_should_process(text, file_type, d);
}

namespace {
// Offset just past the first word `tag` of a block tag opened at `p`, or npos.
size_t match_tag_name(std::string_view text, size_t p, std::string_view tag){
    size_t q = p + block_open.size();
    while(q < text.size() && (text[q]==' ' || text[q]=='\t' || text[q]=='\r' || text[q]=='\n')) ++q;
    if(text.compare(q, tag.size(), tag) != 0) return std::string_view::npos;
    size_t after = q + tag.size();
    if(after >= text.size()) return std::string_view::npos;
    char c = text[after];
    if(c==' ' || c=='\t' || c=='\r' || c=='\n' || text.compare(after, block_close.size(), block_close) == 0) return after;
    return std::string_view::npos;
}
}

bool contains_module_tag(std::string_view text, std::string_view tag){
    size_t p = 0;
    while((p = text.find(block_open, p)) != std::string_view::npos){
        size_t after = match_tag_name(text, p, tag);
        if(after != std::string_view::npos && text.find(block_close, after) != std::string_view::npos) return true;
        p += block_open.size();
    }
    return false;
}

bool default_should_process(std::string_view text, const std::string& file_type, const ModuleDescriptor& d){
    if(!d.file_types.empty() && !d.file_types.count(file_type)) return false;
    if(d.tags.empty()) return true;
    for(auto& t : d.tags) if(contains_module_tag(text, t)) return true;
    return false;
}

std::string replace_module_tags(std::string_view text, std::string_view tag, const std::function<std::string(const token&)>& fn){
    // Substituted values may hold stray openers, so only `{% tag` occurrences are examined.
    std::string out;
    out.reserve(text.size());
    size_t copied = 0, p = 0;
    while((p = text.find(block_open, p)) != std::string_view::npos){
        size_t after = match_tag_name(text, p, tag);
        size_t close = after == std::string_view::npos ? after : text.find(block_close, after);
        if(close == std::string_view::npos){ p += block_open.size(); continue; }
        size_t end = close + block_close.size();
        auto toks = tokenize(text.substr(p, end - p));
        if(toks.size() != 1 || toks[0].kind != token_kind::module_tag){ p += block_open.size(); continue; }
        token t = std::move(toks[0]);
        t.start += p;
        t.end += p;
        out.append(text.substr(copied, p - copied));
        out += fn(t);
        copied = p = end;
    }
    out.append(text.substr(copied));
    return out;
}

} // namespace stencil
