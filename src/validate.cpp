#include "stencil/validate.hpp"
#include "stencil/ast.hpp"
#include "stencil/pipeline.hpp"
#include <algorithm>

namespace stencil {

std::vector<ErrorRecord> validate_template(std::string_view text, const Pipeline* pipeline, const std::string& unit_id){
    std::vector<ErrorRecord> out;
    auto tokens = tokenize(text);

    for(auto& t : tokens){
        if(t.kind == token_kind::text){
            // a text token only holds an opener when that opener was never closed
            size_t at = std::string::npos;
            for(auto o : {raw_open, block_open, placeholder_open}) at = std::min(at, t.raw.find(o));
            if(at != std::string::npos)
                out.push_back(make_error(ErrorKind::Syntax, codes::unclosed_delimiter, "tag opened here is never closed",
                                         "add the closing delimiter or escape the opening one", unit_id, t.start + at, Severity::Fatal));
        }
        else if(t.kind == token_kind::module_tag && pipeline && !pipeline->handles_tag(t.name)){
            out.push_back(make_error(ErrorKind::Syntax, codes::unknown_module_tag, "no registered module handles tag '" + t.name + "'",
                                     "register a module declaring this tag or remove it", unit_id, t.start, Severity::Recoverable));
        }
    }

    try {
        build(tokens);
    } catch(const syntax_error& e){
        out.push_back(from_syntax_error(e, unit_id, Severity::Fatal));
    }

    std::stable_sort(out.begin(), out.end(), [](const ErrorRecord& a, const ErrorRecord& b){ return a.position < b.position; });
    return out;
}

} // namespace stencil
