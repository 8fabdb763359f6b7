// llamaload - Dynamic Loader Implementation

#include "dynamic_loader.hpp"
#include "log.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace llamaload {

DynamicLoader::DynamicLoader(LoaderOptions options) : options_(std::move(options)) {}

Status DynamicLoader::open(const std::string& path, std::vector<NativeHandle>& handles) {
    NativeHandle primary = kInvalidHandle;
    Status status = openModule(path, primary, /*add_search_dir=*/true);
    if (!status.ok()) {
        return status;
    }

    handles.push_back(primary);

    if (options_.preload_siblings) {
        preloadSiblings(path, handles);
    }

    LOGI("Loaded %s with %zu module(s)", path.c_str(), handles.size());
    return Status::OK();
}

Status DynamicLoader::openModule(const std::string& path, NativeHandle& out, bool add_search_dir) {
    Status status = platform::openModule(path, out, add_search_dir);
    if (status.ok()) {
        track(out);
    }
    return status;
}

void DynamicLoader::preloadSiblings(const std::string& path, std::vector<NativeHandle>& handles) {
    const fs::path primary(path);
    const std::string dir = primary.has_parent_path() ? primary.parent_path().string() : ".";
    const std::string primary_name = primary.filename().string();

    auto candidates = listSiblingModules(dir, primary_name, options_.manifest);
    LOGD("Preloading %zu sibling module(s) from %s", candidates.size(), dir.c_str());

    size_t loaded = 0;
    for (const auto& candidate : candidates) {
        NativeHandle handle = kInvalidHandle;
        Status status = openModule(candidate, handle);
        if (!status.ok()) {
            // 尽力而为：兄弟模块打不开不影响主库
            LOGW("Skipping sibling %s: %s", candidate.c_str(), status.toString().c_str());
            continue;
        }

        if (std::find(handles.begin(), handles.end(), handle) != handles.end()) {
            // 已经作为依赖被加载过，归还多出来的引用
            Status released = close(handle);
            if (!released.ok()) {
                LOGW("Releasing duplicate %s: %s", candidate.c_str(), released.toString().c_str());
            }
            continue;
        }

        handles.push_back(handle);
        loaded++;
        LOGD("Preloaded sibling %s -> 0x%zx", candidate.c_str(), static_cast<size_t>(handle));
    }

    LOGD("Sibling preload done: %zu loaded, %zu handle(s) total", loaded, handles.size());
}

Status DynamicLoader::close(NativeHandle handle) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = open_counts_.find(handle);
        if (it == open_counts_.end()) {
            LOGW("close: handle 0x%zx is not open", static_cast<size_t>(handle));
            return Status(ErrorCode::CloseFailed, "handle is not open");
        }
        if (--it->second == 0) {
            open_counts_.erase(it);
        }
    }
    return platform::closeModule(handle);
}

void* DynamicLoader::resolve(NativeHandle handle, std::string_view name) const {
    if (!isOpen(handle)) return nullptr;
    return platform::findSymbol(handle, name);
}

bool DynamicLoader::isOpen(NativeHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_counts_.count(handle) != 0;
}

void DynamicLoader::track(NativeHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_counts_[handle]++;
}

} // namespace llamaload
