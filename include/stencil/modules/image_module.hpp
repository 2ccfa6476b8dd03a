// image_module.hpp - {% image path %} tags resolved, fetched and embedded through the asset sink
#pragma once
#include "stencil/module.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stencil {

// Acquires image bytes for a source string (file path, URL, ...). May block on I/O;
// it runs on the unit's worker thread. Throws on failure.
class AssetFetcher {
public:
    virtual ~AssetFetcher() = default;
    virtual std::vector<uint8_t> fetch(const std::string& source) = 0;
};

// Reads sources as local file paths, optionally relative to a base directory.
class FileAssetFetcher : public AssetFetcher {
public:
    explicit FileAssetFetcher(std::string base_dir = {}): base_dir_(std::move(base_dir)) {}
    std::vector<uint8_t> fetch(const std::string& source) override;
private:
    std::string base_dir_;
};

class ImageModule : public Module {
public:
    static constexpr const char* module_name = "image";
    static constexpr int default_priority = 30;

    explicit ImageModule(std::shared_ptr<AssetFetcher> fetcher = std::make_shared<FileAssetFetcher>(),
                         std::set<std::string> file_types = {})
        : fetcher_(std::move(fetcher)), file_types_(std::move(file_types)) {}

    ModuleDescriptor describe() const override;
    std::string render(std::string text, RenderEnv& env) override;

private:
    std::shared_ptr<AssetFetcher> fetcher_;
    std::set<std::string> file_types_;

    std::string embed_one(const token& tag, RenderEnv& env);
};

// Lower-cased extension of `source` (without the dot), or "png" when it has none.
std::string image_extension(const std::string& source);

} // namespace stencil
