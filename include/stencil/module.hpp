// module.hpp - Pluggable transformation modules driven through four phases per content unit
#pragma once
#include "stencil/context.hpp"
#include "stencil/errors.hpp"
#include "stencil/options.hpp"
#include "stencil/token.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace stencil {

struct PhaseSet {
    bool preparse = false;
    bool token_transform = false;
    bool render = false;
    bool postrender = false;
};

struct ModuleDescriptor {
    std::string name;                  // unique within a pipeline
    std::set<std::string> tags;        // module tag names this module handles; empty = always applicable
    std::set<std::string> file_types;  // empty = every file type
    int priority = 100;                // lower runs earlier
    PhaseSet phases;
};

// Caller-supplied destination for binary assets. Returns an opaque reference to splice into the text.
class AssetSink {
public:
    virtual ~AssetSink() = default;
    virtual std::string embed(const std::vector<uint8_t>& bytes, const std::string& desired_name) = 0;
};

// Run-scoped asset id allocation. One counter per run, shared by all units and modules.
class AssetIds {
public:
    uint64_t next(){ return next_.fetch_add(1, std::memory_order_relaxed); }
    uint64_t issued() const { return next_.load(std::memory_order_relaxed) - 1; }
private:
    std::atomic<uint64_t> next_{1};
};

// Everything a module's render phase may touch for the current unit.
struct RenderEnv {
    const Scope& scope;
    const std::string& file_type;
    const std::string& unit_id;
    const RenderOptions& options;
    AssetIds& asset_ids;
    AssetSink* assets;     // may be null
    ErrorCollector& errors;
    std::string module_name;

    value_ptr resolve(std::string_view path) const { return scope.resolve(path); }
    const value_ptr& context() const { return scope.root(); }

    // Record a module diagnostic for this unit. Strict mode records it as Fatal and throws render_error.
    void report(std::string code, std::string message, std::string hint = {}, std::optional<size_t> position = std::nullopt) const;
};

class Module {
public:
    virtual ~Module() = default;

    virtual ModuleDescriptor describe() const = 0;

    // Applicability test run before each phase on the current text.
    virtual bool should_process(std::string_view text, const std::string& file_type, const ModuleDescriptor& d) const;

    virtual std::string preparse(std::string text, const std::string& file_type){ (void)file_type; return text; }
    virtual std::vector<token> transform_tokens(std::vector<token> tokens, const std::string& file_type){ (void)file_type; return tokens; }
    virtual std::string render(std::string text, RenderEnv& env){ (void)env; return text; }
    virtual std::string postrender(std::string text, const std::string& file_type){ (void)file_type; return text; }
};

// File type supported and (no tags declared or some `{% tag ...%}` present in text).
bool default_should_process(std::string_view text, const std::string& file_type, const ModuleDescriptor& d);

// True if `text` contains a block tag whose first word is `tag`.
bool contains_module_tag(std::string_view text, std::string_view tag);

// Replace every `{% tag DATA %}` in `text` with fn(token). Other text is copied verbatim.
std::string replace_module_tags(std::string_view text, std::string_view tag, const std::function<std::string(const token&)>& fn);

// Module assembled from callbacks. Registering a handler enables its phase.
class LambdaModule : public Module {
public:
    using TextFn = std::function<std::string(std::string, const std::string& file_type)>;
    using TokensFn = std::function<std::vector<token>(std::vector<token>, const std::string& file_type)>;
    using RenderFn = std::function<std::string(std::string, RenderEnv&)>;
    using ShouldProcessFn = std::function<bool(std::string_view, const std::string&)>;

    explicit LambdaModule(ModuleDescriptor d): desc_(std::move(d)) {}

    LambdaModule& on_preparse(TextFn fn){ preparse_ = std::move(fn); desc_.phases.preparse = true; return *this; }
    LambdaModule& on_tokens(TokensFn fn){ tokens_ = std::move(fn); desc_.phases.token_transform = true; return *this; }
    LambdaModule& on_render(RenderFn fn){ render_ = std::move(fn); desc_.phases.render = true; return *this; }
    LambdaModule& on_postrender(TextFn fn){ postrender_ = std::move(fn); desc_.phases.postrender = true; return *this; }
    LambdaModule& when(ShouldProcessFn fn){ should_ = std::move(fn); return *this; }

    ModuleDescriptor describe() const override { return desc_; }
    bool should_process(std::string_view text, const std::string& file_type, const ModuleDescriptor& d) const override {
        return should_ ? should_(text, file_type) : default_should_process(text, file_type, d);
    }
    std::string preparse(std::string text, const std::string& ft) override { return preparse_ ? preparse_(std::move(text), ft) : text; }
    std::vector<token> transform_tokens(std::vector<token> t, const std::string& ft) override { return tokens_ ? tokens_(std::move(t), ft) : t; }
    std::string render(std::string text, RenderEnv& env) override { return render_ ? render_(std::move(text), env) : text; }
    std::string postrender(std::string text, const std::string& ft) override { return postrender_ ? postrender_(std::move(text), ft) : text; }

private:
    ModuleDescriptor desc_;
    TextFn preparse_, postrender_;
    TokensFn tokens_;
    RenderFn render_;
    ShouldProcessFn should_;
};

} // namespace stencil
