// pipeline.hpp - Priority-ordered module registry and the per-unit render driver
#pragma once
#include "stencil/module.hpp"
#include "stencil/render.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace stencil {

// One independently renderable text blob.
struct ContentUnit {
    std::string id;
    std::string file_type;
    std::string text;
};

struct RenderedUnit {
    std::string id;
    std::string text;
};

struct RenderResult {
    bool success = true;     // no Fatal records
    bool cancelled = false;  // some units were abandoned before finishing
    std::vector<RenderedUnit> units;  // finished units, in input order
    std::vector<StructuralHint> hints;
    std::vector<ErrorRecord> errors;
};

class Pipeline {
public:
    explicit Pipeline(RenderOptions opts = {}): opts_(std::move(opts)) {}

    // Throws std::invalid_argument for a null module, an empty name or a duplicate name.
    Pipeline& register_module(std::shared_ptr<Module> m);
    Pipeline& register_module(ModuleDescriptor d, std::shared_ptr<Module> m);
    bool unregister_module(const std::string& name);

    // Module names in execution order (priority ascending, then registration order).
    std::vector<std::string> order() const;
    std::shared_ptr<Module> find(const std::string& name) const;
    const ModuleDescriptor* descriptor(const std::string& name) const;
    // True if a registered module declares `tag`.
    bool handles_tag(const std::string& tag) const;
    size_t size() const { return modules_.size(); }
    void clear(){ modules_.clear(); }

    RenderOptions& options(){ return opts_; }
    const RenderOptions& options() const { return opts_; }

    // Render every unit against `ctx`. Units run on up to worker_count(options()) threads.
    // `cancel`, when set, abandons units not yet started and stops running units between phases.
    // Exceptions that are not std::exception subclasses raised by modules are rethrown here
    // after all workers have joined.
    RenderResult run(const std::vector<ContentUnit>& units, const value_ptr& ctx,
                     AssetSink* sink = nullptr, const std::atomic<bool>* cancel = nullptr);

    // Diagnostics of the most recent run (reset when the next run starts).
    const ErrorCollector& errors() const { return errors_; }

private:
    struct Entry {
        ModuleDescriptor desc;
        std::shared_ptr<Module> impl;
        uint64_t seq = 0;
    };
    enum class UnitStatus { Done, Aborted, Cancelled };
    struct UnitOutcome {
        UnitStatus status = UnitStatus::Cancelled;
        std::string text;
        std::vector<StructuralHint> hints;
    };
    struct RunState;

    std::vector<Entry> modules_;
    uint64_t next_seq_ = 0;
    RenderOptions opts_;
    ErrorCollector errors_;

    void sort_modules();
    UnitOutcome process_unit(const ContentUnit& unit, RunState& rs);
    template<typename T, typename F>
    bool guarded_phase(const Entry& e, const char* phase, const ContentUnit& unit, T& value, F&& fn);
};

} // namespace stencil
