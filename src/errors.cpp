#include "stencil/errors.hpp"

namespace stencil {

const char* to_string(ErrorKind k){
    switch(k){
        case ErrorKind::Syntax: return "SyntaxError";
        case ErrorKind::Resolution: return "ResolutionError";
        case ErrorKind::Type: return "TypeError";
        case ErrorKind::Module: return "ModuleError";
    }
    return "?";
}

const char* to_string(Severity s){ return s == Severity::Fatal ? "fatal" : "recoverable"; }

bool ErrorCollector::has_fatal() const {
    std::lock_guard<std::mutex> lk(mu_);
    for(auto& r : records_) if(r.severity == Severity::Fatal) return true;
    return false;
}

ErrorRecord make_error(ErrorKind kind, std::string code, std::string message, std::string hint,
                       std::string unit_id, std::optional<size_t> position, Severity severity){
    return ErrorRecord{kind, std::move(code), std::move(message), std::move(hint), std::move(unit_id), position, severity};
}

static const char* syntax_hint(const std::string& code){
    if(code == codes::block_end_without_open) return "remove the stray end tag or add its opening tag";
    if(code == codes::block_end_mismatch) return "close the innermost block first";
    if(code == codes::misplaced_else) return "use a single {% else %} inside {% if %} ... {% endif %}";
    if(code == codes::unterminated_block) return "add the matching {% endloop %} or {% endif %}";
    if(code == codes::malformed_loop_header) return "write the header as {% loop VAR in PATH %}; VAR may not be $index, $first, $last or $length";
    return "";
}

ErrorRecord from_syntax_error(const syntax_error& e, const std::string& unit_id, Severity severity){
    return make_error(ErrorKind::Syntax, e.code, e.what(), syntax_hint(e.code), unit_id, e.position, severity);
}

} // namespace stencil
