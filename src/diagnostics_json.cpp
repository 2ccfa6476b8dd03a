#include "stencil/diagnostics_json.hpp"
#include "stencil/options.hpp"
#include <cstdio>
#include <sstream>

namespace stencil {

static void append_error_json(std::ostringstream& os, const ErrorRecord& e){
    os<<"{"
        "\"kind\":"<<json_escape(to_string(e.kind))
      <<",\"code\":"<<json_escape(e.code)
      <<",\"message\":"<<json_escape(e.message)
      <<",\"hint\":"<<json_escape(e.hint)
      <<",\"unit\":"<<json_escape(e.unit_id)
      <<",\"position\":";
    if(e.position) os<<*e.position; else os<<"null";
    os<<",\"severity\":"<<json_escape(to_string(e.severity))
      <<"}";
}

std::string errors_to_json(const std::vector<ErrorRecord>& errors){
    std::ostringstream os;
    os<<"[";
    for(size_t i=0;i<errors.size(); ++i){
        if(i) os<<",";
        append_error_json(os, errors[i]);
    }
    os<<"]";
    return os.str();
}

std::string diagnostics_to_json(const RenderResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")
      <<",\"cancelled\":"<<(r.cancelled?"true":"false")
      <<",\"errors\":"<<errors_to_json(r.errors)
      <<",\"hints\":[";
    for(size_t i=0;i<r.hints.size(); ++i){
        const auto &h=r.hints[i]; if(i) os<<",";
        os<<"{"
            "\"kind\":"<<json_escape(to_string(h.kind))
          <<",\"position\":"<<h.position
          <<",\"unit\":"<<json_escape(h.unit_id)
          <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const RenderResult& r, bool force){
    if(force || flag_enabled("STENCIL_DIAG_JSON")){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace stencil
