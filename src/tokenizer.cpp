// tokenizer.cpp - Single left-to-right scan over the five tag syntaxes
#include "stencil/token.hpp"
#include "stencil/tag_syntax.hpp"
#include <algorithm>

namespace stencil {

namespace {

struct scanner {
    std::string_view d;
    size_t p = 0;
    std::vector<token> out;

    bool at(std::string_view s) const { return d.compare(p, s.size(), s) == 0; }

    void push(token t, size_t end){
        t.start = p; t.end = end;
        t.raw = std::string(d.substr(p, end - p));
        out.push_back(std::move(t));
        p = end;
    }

    void text_until(size_t end){
        if(end <= p) return;
        token t; t.kind = token_kind::text;
        // merge with a preceding text token so degraded openers do not fragment the stream
        if(!out.empty() && out.back().kind == token_kind::text && out.back().end == p){
            out.back().raw.append(d.substr(p, end - p));
            out.back().end = end;
            p = end;
            return;
        }
        push(std::move(t), end);
    }

    // Interior of a tag opened by `open` and closed by `close`, or npos when unclosed.
    size_t find_close(std::string_view open, std::string_view close) const {
        size_t c = d.find(close, p + open.size());
        return c == std::string_view::npos ? std::string_view::npos : c + close.size();
    }

    std::string interior(size_t end, std::string_view open, std::string_view close) const {
        return std::string(trim(d.substr(p + open.size(), end - p - open.size() - close.size())));
    }

    bool simple_tag(std::string_view open, std::string_view close, token_kind kind){
        size_t end = find_close(open, close);
        if(end == std::string_view::npos){ text_until(d.size()); return true; }
        token t; t.kind = kind; t.path = interior(end, open, close);
        push(std::move(t), end);
        return true;
    }

    void block_tag(){
        size_t end = find_close(block_open, block_close);
        if(end == std::string_view::npos){ text_until(d.size()); return; }
        std::string body = interior(end, block_open, block_close);
        size_t ws = body.find_first_of(" \t\r\n");
        std::string word = body.substr(0, ws);
        std::string rest = ws == std::string::npos ? std::string() : std::string(trim(std::string_view(body).substr(ws)));
        token t;
        if(word == "loop"){
            t.kind = token_kind::loop_start;
            t.data = rest;
            if(auto h = parse_loop_header(rest)){ t.var = h->var; t.path = h->collection; }
            else t.well_formed = false;
        }
        else if(word == "endloop") t.kind = token_kind::loop_end;
        else if(word == "if"){ t.kind = token_kind::cond_if; t.expr = rest; }
        else if(word == "else") t.kind = token_kind::cond_else;
        else if(word == "endif") t.kind = token_kind::cond_end;
        else { t.kind = token_kind::module_tag; t.name = word; t.data = rest; }
        push(std::move(t), end);
    }

    size_t next_opener() const {
        size_t best = d.size();
        for(auto o : {raw_open, block_open, placeholder_open}){
            size_t f = d.find(o, p + 1);
            if(f != std::string_view::npos) best = std::min(best, f);
        }
        return best;
    }

    void run(){
        while(p < d.size()){
            if(at(raw_open)) simple_tag(raw_open, raw_close, token_kind::raw_splice);
            else if(at(paragraph_open)) simple_tag(paragraph_open, placeholder_close, token_kind::paragraph_placeholder);
            else if(at(block_open)) block_tag();
            else if(at(placeholder_open)) simple_tag(placeholder_open, placeholder_close, token_kind::placeholder);
            else text_until(next_opener());
        }
    }
};

} // namespace

std::vector<token> tokenize(std::string_view text){
    scanner s{text};
    s.run();
    return std::move(s.out);
}

std::string join_raw(const std::vector<token>& tokens){
    std::string out;
    for(auto& t : tokens) out += t.raw;
    return out;
}

const char* to_string(token_kind k){
    switch(k){
        case token_kind::text: return "text";
        case token_kind::placeholder: return "placeholder";
        case token_kind::paragraph_placeholder: return "paragraph_placeholder";
        case token_kind::raw_splice: return "raw_splice";
        case token_kind::loop_start: return "loop_start";
        case token_kind::loop_end: return "loop_end";
        case token_kind::cond_if: return "cond_if";
        case token_kind::cond_else: return "cond_else";
        case token_kind::cond_end: return "cond_end";
        case token_kind::module_tag: return "module_tag";
    }
    return "?";
}

} // namespace stencil
