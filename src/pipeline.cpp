// pipeline.cpp - Module registry ordering, per-unit phase chain and the unit worker pool
#include "stencil/pipeline.hpp"
#include "stencil/diagnostics_json.hpp"
#include "stencil/log.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace stencil {

struct Pipeline::RunState {
    Scope scope;
    AssetIds asset_ids;
    AssetSink* sink = nullptr;
    const std::atomic<bool>* cancel = nullptr;
    std::atomic<bool> abort{false};  // set by an invocation-fatal error

    RunState(const value_ptr& ctx, AssetSink* s, const std::atomic<bool>* c): scope(ctx), sink(s), cancel(c) {}
    bool cancelled() const { return cancel && cancel->load(); }
    bool stop_requested() const { return abort.load() || cancelled(); }
};

// ---- registry ----

Pipeline& Pipeline::register_module(std::shared_ptr<Module> m){
    if(!m) throw std::invalid_argument("register_module: null module");
    auto d = m->describe();
    return register_module(std::move(d), std::move(m));
}

Pipeline& Pipeline::register_module(ModuleDescriptor d, std::shared_ptr<Module> m){
    if(!m) throw std::invalid_argument("register_module: null module");
    if(d.name.empty()) throw std::invalid_argument("register_module: module name must not be empty");
    for(auto& e : modules_)
        if(e.desc.name == d.name) throw std::invalid_argument("register_module: duplicate module name '" + d.name + "'");
    log_line(LogLevel::Info, "pipeline", "registered module %s (priority %d)", d.name.c_str(), d.priority);
    modules_.push_back(Entry{std::move(d), std::move(m), next_seq_++});
    sort_modules();
    return *this;
}

bool Pipeline::unregister_module(const std::string& name){
    auto it = std::find_if(modules_.begin(), modules_.end(), [&](const Entry& e){ return e.desc.name == name; });
    if(it == modules_.end()) return false;
    modules_.erase(it);
    sort_modules();
    log_line(LogLevel::Info, "pipeline", "unregistered module %s", name.c_str());
    return true;
}

void Pipeline::sort_modules(){
    std::stable_sort(modules_.begin(), modules_.end(), [](const Entry& a, const Entry& b){
        if(a.desc.priority != b.desc.priority) return a.desc.priority < b.desc.priority;
        return a.seq < b.seq;
    });
}

std::vector<std::string> Pipeline::order() const {
    std::vector<std::string> out;
    out.reserve(modules_.size());
    for(auto& e : modules_) out.push_back(e.desc.name);
    return out;
}

std::shared_ptr<Module> Pipeline::find(const std::string& name) const {
    for(auto& e : modules_) if(e.desc.name == name) return e.impl;
    return nullptr;
}

const ModuleDescriptor* Pipeline::descriptor(const std::string& name) const {
    for(auto& e : modules_) if(e.desc.name == name) return &e.desc;
    return nullptr;
}

bool Pipeline::handles_tag(const std::string& tag) const {
    for(auto& e : modules_) if(e.desc.tags.count(tag)) return true;
    return false;
}

// ---- per unit ----

template<typename T, typename F>
bool Pipeline::guarded_phase(const Entry& e, const char* phase, const ContentUnit& unit, T& value, F&& fn){
    try {
        value = fn(T(value));
        return true;
    } catch(const render_error& re){
        // already collected by RenderEnv::report
        if(opts_.strict){
            log_line(LogLevel::Error, "pipeline", "unit %s aborted: module %s failed in %s: %s", unit.id.c_str(), e.desc.name.c_str(), phase, re.what());
            return false;
        }
        log_line(LogLevel::Warn, "pipeline", "unit %s: module %s failed in %s (recovered): %s", unit.id.c_str(), e.desc.name.c_str(), phase, re.what());
        return true;
    } catch(const std::exception& ex){
        Severity sev = opts_.strict ? Severity::Fatal : Severity::Recoverable;
        errors_.add(make_error(ErrorKind::Module, codes::module_phase_failed,
                               "module '" + e.desc.name + "' failed in " + phase + ": " + ex.what(),
                               "the unit continues with the text from before this phase", unit.id, std::nullopt, sev));
        if(opts_.strict){
            log_line(LogLevel::Error, "pipeline", "unit %s aborted: module %s failed in %s: %s", unit.id.c_str(), e.desc.name.c_str(), phase, ex.what());
            return false;
        }
        log_line(LogLevel::Warn, "pipeline", "unit %s: module %s failed in %s (recovered): %s", unit.id.c_str(), e.desc.name.c_str(), phase, ex.what());
        return true;
    }
}

Pipeline::UnitOutcome Pipeline::process_unit(const ContentUnit& unit, RunState& rs){
    UnitOutcome out;
    auto aborted = [&](){
        out.status = UnitStatus::Aborted;
        if(opts_.strict && opts_.abort_on_fatal) rs.abort.store(true);
        return out;
    };
    auto applicable = [&](const Entry& e, bool declared, const std::string& text){
        return declared && e.impl->should_process(text, unit.file_type, e.desc);
    };

    log_line(LogLevel::Debug, "pipeline", "unit %s (%s) start", unit.id.c_str(), unit.file_type.c_str());
    std::string text = unit.text;

    // 1. preparse
    for(auto& e : modules_){
        if(!applicable(e, e.desc.phases.preparse, text)) continue;
        if(!guarded_phase(e, "preparse", unit, text, [&](std::string t){ return e.impl->preparse(std::move(t), unit.file_type); }))
            return aborted();
    }
    if(rs.stop_requested()) return out;

    // 2. tokenize, token transforms, build once
    auto tokens = tokenize(text);
    for(auto& e : modules_){
        if(!applicable(e, e.desc.phases.token_transform, text)) continue;
        if(!guarded_phase(e, "token transform", unit, tokens, [&](std::vector<token> t){ return e.impl->transform_tokens(std::move(t), unit.file_type); }))
            return aborted();
    }
    node_list tree;
    try {
        tree = build(tokens);
    } catch(const syntax_error& se){
        errors_.add(from_syntax_error(se, unit.id, Severity::Fatal));
        if(opts_.strict){
            log_line(LogLevel::Error, "pipeline", "unit %s: %s at offset %zu; aborting run", unit.id.c_str(), se.what(), se.position);
            rs.abort.store(true);
            out.status = UnitStatus::Aborted;
            return out;
        }
        log_line(LogLevel::Warn, "pipeline", "unit %s: %s at offset %zu; passing through unmodified", unit.id.c_str(), se.what(), se.position);
        out.status = UnitStatus::Done;
        out.text = unit.text;
        return out;
    }
    if(rs.stop_requested()) return out;

    // 3. core render; module tags stay as their tag text
    try {
        Renderer r(opts_, errors_, unit.id);
        auto res = r.render(tree, rs.scope);
        text = std::move(res.text);
        out.hints = std::move(res.hints);
    } catch(const render_error& re){
        log_line(LogLevel::Error, "pipeline", "unit %s aborted: %s", unit.id.c_str(), re.what());
        return aborted();
    }
    if(rs.stop_requested()) return out;

    // 4. module render
    for(auto& e : modules_){
        if(!applicable(e, e.desc.phases.render, text)) continue;
        RenderEnv env{rs.scope, unit.file_type, unit.id, opts_, rs.asset_ids, rs.sink, errors_, e.desc.name};
        if(!guarded_phase(e, "render", unit, text, [&](std::string t){ return e.impl->render(std::move(t), env); }))
            return aborted();
    }
    if(rs.stop_requested()) return out;

    // 5. postrender
    for(auto& e : modules_){
        if(!applicable(e, e.desc.phases.postrender, text)) continue;
        if(!guarded_phase(e, "postrender", unit, text, [&](std::string t){ return e.impl->postrender(std::move(t), unit.file_type); }))
            return aborted();
    }

    log_line(LogLevel::Debug, "pipeline", "unit %s done (%zu bytes)", unit.id.c_str(), text.size());
    out.status = UnitStatus::Done;
    out.text = std::move(text);
    return out;
}

// ---- run ----

RenderResult Pipeline::run(const std::vector<ContentUnit>& units, const value_ptr& ctx, AssetSink* sink, const std::atomic<bool>* cancel){
    errors_.reset();
    RunState rs(ctx, sink, cancel);
    std::vector<UnitOutcome> outcomes(units.size());
    std::atomic<size_t> next{0};
    std::mutex failure_mu;
    std::exception_ptr failure;

    auto worker = [&](){
        while(true){
            size_t i = next.fetch_add(1);
            if(i >= units.size()) return;
            if(rs.stop_requested()) continue; // left as Cancelled
            try {
                outcomes[i] = process_unit(units[i], rs);
            } catch(...){
                // carried to the caller after join
                std::lock_guard<std::mutex> lk(failure_mu);
                if(!failure) failure = std::current_exception();
                rs.abort.store(true);
            }
        }
    };

    size_t n = std::min(worker_count(opts_), units.size());
    if(n <= 1){
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(n);
        for(size_t i = 0; i < n; ++i) pool.emplace_back(worker);
        for(auto& t : pool) t.join();
    }
    if(failure) std::rethrow_exception(failure);

    RenderResult result;
    for(size_t i = 0; i < units.size(); ++i){
        auto& o = outcomes[i];
        if(o.status == UnitStatus::Cancelled){ result.cancelled = true; continue; }
        if(o.status == UnitStatus::Aborted) continue;
        result.units.push_back(RenderedUnit{units[i].id, std::move(o.text)});
        result.hints.insert(result.hints.end(), o.hints.begin(), o.hints.end());
    }
    result.errors = errors_.all();
    result.success = !errors_.has_fatal();
    if(result.cancelled) log_line(LogLevel::Info, "pipeline", "run abandoned %zu of %zu units", units.size() - result.units.size(), units.size());
    maybe_print_json(result, opts_.diag_json);
    return result;
}

} // namespace stencil
