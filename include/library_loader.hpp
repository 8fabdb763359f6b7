// llamaload - Library Load Orchestrator
#pragma once

#include "dynamic_loader.hpp"
#include "path_resolver.hpp"
#include "platform.hpp"
#include "status.hpp"
#include "symbol_registry.hpp"
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace llamaload {

enum class LoadState {
    Unloaded,
    Loaded,
};

const char* loadStateName(LoadState state);

// 函数表的持有者实现此接口；bind 在每个加载会话中调用一次
class SymbolBinder {
public:
    virtual ~SymbolBinder() = default;

    // 返回非 OK 时本次加载失败并回到 Unloaded
    virtual Status bind(const SymbolRegistry& registry, NativeHandle primary) = 0;

    // 卸载或加载失败后调用，所有槽位复位
    virtual void reset() = 0;
};

class LibraryLoader {
public:
    LibraryLoader(const PathResolver& resolver, SymbolBinder& binder,
                  LoaderOptions options = LoaderOptions());
    ~LibraryLoader();

    LibraryLoader(const LibraryLoader&) = delete;
    LibraryLoader& operator=(const LibraryLoader&) = delete;

    // 已加载时直接返回 OK；并发调用只有一个真正执行加载
    Status load();

    // 未加载时直接返回 OK。关闭失败会汇总为 CloseFailed，但状态仍然切到 Unloaded
    Status unload();

    // 快速路径只取共享锁
    Status ensureLoaded();

    bool isLoaded() const;
    LoadState state() const;
    NativeHandle handle() const;
    std::string path() const;

    // 当前会话的 HandleSet 快照（主句柄在前）
    std::vector<NativeHandle> handles() const;

    // 每次成功加载加一，用于区分会话
    uint64_t session() const;

    // 在当前会话的所有模块中查找，未加载时返回无效结果
    SymbolBinding findSymbol(std::string_view name) const;

    template <typename T>
    T getSymbol(std::string_view name) const {
        return reinterpret_cast<T>(findSymbol(name).address);
    }

    const DynamicLoader& dynamicLoader() const { return loader_; }

private:
    Status loadLocked();
    Status unloadLocked();
    // 返回关闭失败的数量，失败信息追加到 failures
    size_t closeAll(const std::vector<NativeHandle>& handles, std::string& failures);

    const PathResolver& resolver_;
    SymbolBinder& binder_;

    DynamicLoader loader_;
    SymbolRegistry registry_;

    mutable std::shared_mutex mutex_;
    LoadState state_ = LoadState::Unloaded;
    NativeHandle handle_ = kInvalidHandle;
    std::string path_;
    std::string scratch_dir_;
    uint64_t session_ = 0;
};

} // namespace llamaload
