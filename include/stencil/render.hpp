// render.hpp - Tree evaluation against a context scope
#pragma once
#include "stencil/ast.hpp"
#include "stencil/context.hpp"
#include "stencil/errors.hpp"
#include "stencil/options.hpp"
#include <string>
#include <vector>

namespace stencil {

enum class HintKind { RemoveEnclosingBlock };

// Signal for the format layer, e.g. drop the paragraph around an empty {{? path }}.
struct StructuralHint {
    HintKind kind = HintKind::RemoveEnclosingBlock;
    size_t position = 0;
    std::string unit_id;
};

const char* to_string(HintKind k);

struct RenderOutput {
    std::string text;
    std::vector<StructuralHint> hints;
};

// Evaluates one unit's tree. Recoverable problems go to the collector; in strict mode the
// first escalated problem is collected as Fatal and thrown as render_error.
class Renderer {
public:
    Renderer(const RenderOptions& opts, ErrorCollector& errors, std::string unit_id = {})
        : opts_(opts), errors_(errors), unit_id_(std::move(unit_id)) {}

    RenderOutput render(const node_list& nodes, const value_ptr& ctx);
    RenderOutput render(const node_list& nodes, const Scope& scope);

    // Evaluate a conditional expression (`path`, `path OP operand`). Never throws.
    bool evaluate(std::string_view expr, const Scope& scope, size_t position = 0);

private:
    const RenderOptions& opts_;
    ErrorCollector& errors_;
    std::string unit_id_;

    struct State { std::string out; std::vector<StructuralHint> hints; };

    void render_nodes(const node_list& nodes, const Scope& scope, State& st);
    void render_node(const node& n, const Scope& scope, State& st);
    void render_placeholder(const std::string& path, size_t position, const Scope& scope, State& st);
    void render_loop(const loop_node& n, const Scope& scope, State& st);

    std::string format(const value& v, const std::string& path) const;
    void report(ErrorKind kind, const char* code, std::string message, std::string hint, size_t position, bool escalate);
};

// Tokenize, build and render `text` in one call. Throws syntax_error or (strict) render_error.
RenderOutput render_template(std::string_view text, const value_ptr& ctx, const RenderOptions& opts,
                             ErrorCollector& errors, const std::string& unit_id = {});

} // namespace stencil
