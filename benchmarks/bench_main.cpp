#include "stencil/stencil.hpp"
#include <chrono>
#include <iostream>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_build; double ms_run; size_t out_bytes; };

static RunResult bench_case(const char* name, const std::string &tpl, const stencil::value_ptr& ctx, size_t units, size_t workers){
    stencil::RenderOptions opts; opts.max_concurrency = workers;
    stencil::Pipeline pipeline(opts);

    auto t0 = Clock::now();
    auto tree = stencil::parse_template(tpl);
    auto t1 = Clock::now();
    (void)tree;

    std::vector<stencil::ContentUnit> batch;
    for(size_t i=0;i<units;++i) batch.push_back({"u"+std::to_string(i), "txt", tpl});
    auto res = pipeline.run(batch, ctx);
    auto t2 = Clock::now();
    if(!res.success){
        std::cerr << "[bench] case '" << name << "' reported fatal errors\n";
        return {0.0, 0.0, 0};
    }
    size_t bytes = 0; for(auto& u : res.units) bytes += u.text.size();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(),
             std::chrono::duration<double, std::milli>(t2 - t1).count(), bytes };
}

int main(){
    stencil::set_log_level(stencil::LogLevel::Error);
    size_t workers = 4;
    if(const char* v = std::getenv("STENCIL_CONCURRENCY")) workers = static_cast<size_t>(std::strtoul(v, nullptr, 10));

    std::vector<stencil::value_ptr> rows;
    for(int i=0;i<200;++i)
        rows.push_back(stencil::value_map({stencil::kv("id", stencil::v_i64(i)), stencil::kv("name", stencil::v_str("row" + std::to_string(i))),
                                           stencil::kv("cells", stencil::value_seq({stencil::v_i64(i), stencil::v_f64(i * 0.5), stencil::v_bool(i % 2 == 0)}))}));
    auto ctx = stencil::value_map({stencil::kv("title", stencil::v_str("Report")), stencil::kv("rows", stencil::value_seq(rows))});

    struct Case { const char* name; std::string tpl; size_t units; };
    std::vector<Case> cases{
        {"placeholders", "{{title}} {{title}} {{title}} {{rows.0.name}} {{rows.199.cells.1}}\n", 256},
        {"nested_loops", "{%loop r in rows%}<tr>{%loop c in r.cells%}<td>{{c}}</td>{%endloop%}</tr>{%endloop%}", 32},
        {"conditionals", "{%loop r in rows%}{%if r.id >= 100%}{{r.name}}{%else%}-{%endif%}{%if r.cells.2 == true%}!{%endif%}{%endloop%}", 32},
    };

    for(auto& c : cases){
        auto r = bench_case(c.name, c.tpl, ctx, c.units, workers);
        std::cout << c.name << ": build " << r.ms_build << " ms, run " << r.ms_run << " ms (" << c.units << " units, "
                  << r.out_bytes << " bytes)\n";
    }
    return 0;
}
