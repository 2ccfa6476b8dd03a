#include "stencil/modules/image_module.hpp"
#include "stencil/log.hpp"
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace stencil {

std::vector<uint8_t> FileAssetFetcher::fetch(const std::string& source){
    std::string path = source;
    if(!base_dir_.empty() && !source.empty() && source.front() != '/') path = base_dir_ + "/" + source;
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("cannot open '" + path + "'");
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string image_extension(const std::string& source){
    size_t slash = source.find_last_of("/\\");
    size_t dot = source.find_last_of('.');
    if(dot == std::string::npos || (slash != std::string::npos && dot < slash) || dot + 1 == source.size()) return "png";
    std::string ext = source.substr(dot + 1);
    // drop a URL query or fragment
    size_t q = ext.find_first_of("?#");
    if(q != std::string::npos) ext.resize(q);
    if(ext.empty()) return "png";
    for(auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

ModuleDescriptor ImageModule::describe() const {
    ModuleDescriptor d;
    d.name = module_name;
    d.tags = {"image"};
    d.file_types = file_types_;
    d.priority = default_priority;
    d.phases.render = true;
    return d;
}

std::string ImageModule::embed_one(const token& tag, RenderEnv& env){
    const std::string& path = tag.data;
    auto v = env.resolve(path);
    const std::string* src = v ? as_string(*v) : nullptr;
    if(!src || src->empty()){
        env.report(codes::module_value_invalid, "expected a non-empty image source string for '" + path + "'",
                   "bind '" + path + "' to an image path or URL", tag.start);
        return {};
    }
    if(!env.assets){
        env.report(codes::module_value_invalid, "no asset sink for image '" + *src + "'", "pass an AssetSink to Pipeline::run", tag.start);
        return {};
    }
    if(!fetcher_){
        env.report(codes::module_value_invalid, "no fetcher configured for image '" + *src + "'", "", tag.start);
        return {};
    }
    std::vector<uint8_t> bytes;
    try {
        bytes = fetcher_->fetch(*src);
    } catch(const std::exception& e){
        env.report(codes::module_value_invalid, "failed to fetch image '" + *src + "': " + e.what(), "", tag.start);
        return {};
    }
    auto id = env.asset_ids.next();
    std::string name = "image" + std::to_string(id) + "." + image_extension(*src);
    log_line(LogLevel::Debug, "image", "unit %s: embedding %s (%zu bytes) as %s", env.unit_id.c_str(), src->c_str(), bytes.size(), name.c_str());
    return env.assets->embed(bytes, name);
}

std::string ImageModule::render(std::string text, RenderEnv& env){
    return replace_module_tags(text, module_name, [&](const token& t){ return embed_one(t, env); });
}

} // namespace stencil
