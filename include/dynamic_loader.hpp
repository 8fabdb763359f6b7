// llamaload - Dynamic Loader
#pragma once

#include "platform.hpp"
#include "sibling_manifest.hpp"
#include "status.hpp"
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace llamaload {

struct LoaderOptions {
    // Windows 上单个逻辑库被拆成多个 DLL，必须预加载；其他平台按需开启
    bool preload_siblings = kIsWindows;
    SiblingManifest manifest = defaultSiblingManifest();
};

class DynamicLoader {
public:
    explicit DynamicLoader(LoaderOptions options = LoaderOptions());
    ~DynamicLoader() = default;

    DynamicLoader(const DynamicLoader&) = delete;
    DynamicLoader& operator=(const DynamicLoader&) = delete;

    // 打开主库，必要时预加载兄弟模块。
    // 成功时 handles 以主句柄开头，后面是成功打开的兄弟模块（按加载顺序）
    Status open(const std::string& path, std::vector<NativeHandle>& handles);

    // 只打开单个模块
    Status openModule(const std::string& path, NativeHandle& out, bool add_search_dir = false);

    // 对未由本加载器打开（或已关闭）的句柄返回 CloseFailed，不会触碰系统调用
    Status close(NativeHandle handle);

    void* resolve(NativeHandle handle, std::string_view name) const;

    bool isOpen(NativeHandle handle) const;
    const LoaderOptions& options() const { return options_; }

private:
    void preloadSiblings(const std::string& path, std::vector<NativeHandle>& handles);
    void track(NativeHandle handle);

    LoaderOptions options_;

    mutable std::mutex mutex_;
    // 同一文件多次 dlopen 会返回同一句柄，按引用计数跟踪
    std::unordered_map<NativeHandle, size_t> open_counts_;
};

} // namespace llamaload
