#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include "stencil/stencil.hpp"

using namespace stencil;

// Writes embedded assets under a directory and returns their relative path as the reference.
class DirectoryAssetSink : public AssetSink {
public:
    explicit DirectoryAssetSink(std::string dir): dir_(std::move(dir)) {}
    std::string embed(const std::vector<uint8_t>& bytes, const std::string& desired_name) override {
        std::string path = dir_ + "/" + desired_name;
        std::ofstream out(path, std::ios::binary);
        if(!out) throw std::runtime_error("cannot write asset '" + path + "'");
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return path;
    }
private:
    std::string dir_;
};

static void print_errors(const std::vector<ErrorRecord>& errors){
    for(auto &e : errors){
        std::cerr << (e.severity==Severity::Fatal ? "error" : "warning");
        if(!e.code.empty()) std::cerr << "["<<e.code<<"]";
        std::cerr << ": " << e.message;
        if(e.position) std::cerr << " (offset "<<*e.position<<")";
        std::cerr << "\n";
        if(!e.hint.empty()) std::cerr << "  hint: " << e.hint << "\n";
    }
}

int main(int argc, char** argv){
    if(argc<3){ std::cerr << "usage: stencil_driver <template> <context.edn> [file-type=txt] [--validate] [--assets DIR]\n"; return 1; }
    std::string tpl_path = argv[1], ctx_path = argv[2], file_type = "txt", assets_dir;
    bool validate_only = false;
    for(int i=3;i<argc;++i){
        std::string a = argv[i];
        if(a=="--validate") validate_only = true;
        else if(a=="--assets" && i+1<argc) assets_dir = argv[++i];
        else file_type = a;
    }
    auto tpl_text = read_source_file(tpl_path); if(!tpl_text){ std::cerr << "failed to read template\n"; return 1; }
    const std::string& tpl = *tpl_text;

    Pipeline pipeline(detect_env());
    pipeline.register_module(std::make_shared<ImageModule>());

    if(validate_only){
        auto errs = validate_template(tpl, &pipeline, tpl_path);
        print_errors(errs);
        return errs.empty() ? 0 : 2;
    }

    value_ptr ctx;
    auto ctx_text = read_source_file(ctx_path);
    if(!ctx_text){ std::cerr << "failed to read context\n"; return 1; }
    try { ctx = parse_context(*ctx_text); }
    catch(const parse_error& e){ std::cerr << "context: " << e.what() << "\n"; return 1; }

    std::unique_ptr<DirectoryAssetSink> sink;
    if(!assets_dir.empty()) sink = std::make_unique<DirectoryAssetSink>(assets_dir);

    auto res = pipeline.run({ContentUnit{tpl_path, file_type, tpl}}, ctx, sink.get());
    print_errors(res.errors);
    for(auto& u : res.units) std::cout << u.text;
    for(auto& h : res.hints) std::cerr << "hint: " << to_string(h.kind) << " at offset " << h.position << "\n";
    return res.success ? 0 : 2;
}
