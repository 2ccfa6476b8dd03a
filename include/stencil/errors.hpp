// errors.hpp - Error records, the thread-safe collector, and exceptions crossing unit boundaries
#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stencil {

enum class ErrorKind { Syntax, Resolution, Type, Module };
enum class Severity { Recoverable, Fatal };

struct ErrorRecord {
    ErrorKind kind = ErrorKind::Syntax;
    std::string code;      // stable identifier, e.g. S0101
    std::string message;
    std::string hint;      // remediation text, may be empty
    std::string unit_id;
    std::optional<size_t> position; // byte offset of the offending tag in the unit text
    Severity severity = Severity::Recoverable;
};

const char* to_string(ErrorKind k);
const char* to_string(Severity s);

// Diagnostic codes
namespace codes {
inline constexpr const char* block_end_without_open = "S0101";
inline constexpr const char* block_end_mismatch = "S0102";
inline constexpr const char* misplaced_else = "S0103";
inline constexpr const char* unterminated_block = "S0104";
inline constexpr const char* malformed_loop_header = "S0105";
inline constexpr const char* unclosed_delimiter = "S0106";
inline constexpr const char* unknown_module_tag = "S0107";
inline constexpr const char* path_not_found = "R0201";
inline constexpr const char* loop_not_sequence = "T0301";
inline constexpr const char* incomparable_operands = "T0302";
inline constexpr const char* module_phase_failed = "M0401";
inline constexpr const char* module_value_invalid = "M0402";
}

// Thrown by the tree builder. Carries the offending token's offset.
struct syntax_error : std::runtime_error {
    syntax_error(std::string code, std::string message, size_t position)
        : std::runtime_error(message), code(std::move(code)), position(position) {}
    std::string code;
    size_t position;
};

// Thrown by the renderer in strict mode; the record has already been collected.
struct render_error : std::runtime_error {
    explicit render_error(ErrorRecord r) : std::runtime_error(r.message), record(std::move(r)) {}
    ErrorRecord record;
};

// Accumulates diagnostics for one pipeline run. Appends are safe from worker threads.
class ErrorCollector {
public:
    void reset(){ std::lock_guard<std::mutex> lk(mu_); records_.clear(); }
    void add(ErrorRecord r){ std::lock_guard<std::mutex> lk(mu_); records_.push_back(std::move(r)); }
    std::vector<ErrorRecord> all() const { std::lock_guard<std::mutex> lk(mu_); return records_; }
    size_t size() const { std::lock_guard<std::mutex> lk(mu_); return records_.size(); }
    bool has_fatal() const;
private:
    mutable std::mutex mu_;
    std::vector<ErrorRecord> records_;
};

ErrorRecord make_error(ErrorKind kind, std::string code, std::string message, std::string hint,
                       std::string unit_id, std::optional<size_t> position, Severity severity);

// Record for a tree builder failure.
ErrorRecord from_syntax_error(const syntax_error& e, const std::string& unit_id, Severity severity);

} // namespace stencil
