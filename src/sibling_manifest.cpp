// llamaload - Sibling Module Manifest Implementation

#include "sibling_manifest.hpp"
#include "platform.hpp"
#include "log.hpp"
#include <algorithm>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace llamaload {

// 清单对应的 llama.cpp 构建号
static constexpr const char* kManifestVersion = "b6862";

SiblingManifest defaultSiblingManifest() {
    SiblingManifest manifest;
    manifest.version = kManifestVersion;

    static const char* const kModules[] = {
        "ggml-base",        // 核心导出（ggml_backend_cpu_buffer_type 等），必须最先加载
        "ggml",
#if defined(LLAMALOAD_PLATFORM_WINDOWS)
        "ggml-cpu-x64",
#endif
        "ggml-cpu",
        "ggml-blas",
        "ggml-rpc",
        "ggml-cuda",
        "ggml-metal",
        "ggml-vulkan",
        "ggml-kompute",
        "ggml-sycl",
    };

    for (const char* base : kModules) {
        manifest.modules.push_back(platform::moduleFileName(base));
    }
    return manifest;
}

std::vector<std::string> listSiblingModules(const std::string& dir,
                                            const std::string& primary_name,
                                            const SiblingManifest& manifest) {
    std::vector<std::string> result;
    std::set<std::string> listed(manifest.modules.begin(), manifest.modules.end());
    const fs::path base(dir);

    for (const auto& name : manifest.modules) {
        if (name == primary_name) continue;
        std::error_code ec;
        fs::path candidate = base / name;
        if (fs::is_regular_file(candidate, ec)) {
            result.push_back(candidate.string());
        }
    }

    std::error_code ec;
    fs::directory_iterator it(base, ec);
    if (ec) {
        LOGW("Cannot scan %s: %s", dir.c_str(), ec.message().c_str());
        return result;
    }

    const std::string extension = platform::libraryExtension();
    std::vector<std::string> extra;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        const std::string name = it->path().filename().string();
        if (it->path().extension().string() != extension) continue;
        if (name == primary_name || listed.count(name)) continue;
        extra.push_back(name);
    }

    std::sort(extra.begin(), extra.end());
    for (const auto& name : extra) {
        result.push_back((base / name).string());
    }

    LOGD("Sibling candidates in %s: %zu (manifest %s)", dir.c_str(), result.size(),
         manifest.version.c_str());
    return result;
}

} // namespace llamaload
