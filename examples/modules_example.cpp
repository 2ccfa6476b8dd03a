// Modules example: a preparse macro, a custom render-phase tag and the image module.
#include <cctype>
#include <iostream>
#include <string>
#include "stencil/stencil.hpp"

using namespace stencil;

// Prints embedded assets instead of storing them.
class PrintingSink : public AssetSink {
public:
    std::string embed(const std::vector<uint8_t>& bytes, const std::string& desired_name) override {
        std::cerr << "embedded " << desired_name << " (" << bytes.size() << " bytes)\n";
        return "<img src=\"" + desired_name + "\"/>";
    }
};

class InlineFetcher : public AssetFetcher {
public:
    std::vector<uint8_t> fetch(const std::string& source) override { return std::vector<uint8_t>(source.begin(), source.end()); }
};

int main(){
    Pipeline pipeline(detect_env());

    ModuleDescriptor today;
    today.name = "today";
    today.priority = 10;
    auto today_mod = std::make_shared<LambdaModule>(today);
    today_mod->on_preparse([](std::string text, const std::string&){
        for(size_t at; (at = text.find("@TODAY")) != std::string::npos; ) text.replace(at, 6, "{{date}}");
        return text;
    });

    ModuleDescriptor upper;
    upper.name = "upper";
    upper.tags = {"upper"};
    auto upper_mod = std::make_shared<LambdaModule>(upper);
    upper_mod->on_render([](std::string text, RenderEnv& env){
        return replace_module_tags(text, "upper", [&](const token& t){
            auto v = env.resolve(t.data);
            if(!v){ env.report(codes::module_value_invalid, "'" + t.data + "' not found"); return std::string(); }
            std::string s = to_display_string(*v);
            for(auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return s;
        });
    });

    pipeline.register_module(upper_mod)
            .register_module(today_mod)
            .register_module(std::make_shared<ImageModule>(std::make_shared<InlineFetcher>()));

    auto ctx = parse_context(R"({:date "2024-05-01" :name "ada" :logo "logo.svg"
                                 :items [{:label "one" :qty 1} {:label "two" :qty 0}]})");
    std::string tpl =
        "Report for {% upper name %} (@TODAY)\n"
        "{% image logo %}\n"
        "{%loop it in items%}{{$index}}. {{it.label}}{%if it.qty > 0%} in stock{%else%} sold out{%endif%}\n{%endloop%}";

    PrintingSink sink;
    auto res = pipeline.run({ContentUnit{"report", "html", tpl}}, ctx, &sink);
    for(auto& u : res.units) std::cout << u.text;
    std::cout << diagnostics_to_json(res) << "\n";
    return res.success ? 0 : 1;
}
