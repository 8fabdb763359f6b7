// llamaload - Symbol Registry
#pragma once

#include "dynamic_loader.hpp"
#include "platform.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace llamaload {

struct SymbolBinding {
    std::string name;
    void* address = nullptr;
    NativeHandle owner = kInvalidHandle;
    bool valid() const { return address != nullptr; }
};

// 记录本次加载会话中打开的所有模块句柄，按注册顺序查找符号。
// 注册顺序即依赖优先级顺序（关键共享依赖先注册）。
// 本类自身不加锁，由 LibraryLoader 的锁保护
class SymbolRegistry {
public:
    explicit SymbolRegistry(const DynamicLoader& loader) : loader_(loader) {}

    SymbolRegistry(const SymbolRegistry&) = delete;
    SymbolRegistry& operator=(const SymbolRegistry&) = delete;

    // 忽略无效句柄与重复句柄；返回是否新增
    bool registerHandle(NativeHandle handle);

    // 先查 preferred，再按注册顺序查其余句柄（跳过 preferred）
    SymbolBinding resolve(std::string_view name, NativeHandle preferred) const;

    void clear() { handles_.clear(); }

    bool contains(NativeHandle handle) const;
    size_t size() const { return handles_.size(); }
    const std::vector<NativeHandle>& handles() const { return handles_; }

private:
    const DynamicLoader& loader_;
    std::vector<NativeHandle> handles_;
};

} // namespace llamaload
