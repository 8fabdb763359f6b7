// llamaload - Function Registration
#pragma once

#include "log.hpp"
#include "platform.hpp"
#include "status.hpp"
#include "symbol_registry.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace llamaload {

enum class Requirement {
    Required,   // 缺失即加载失败
    Optional,   // 缺失时槽位保持 nullptr
};

enum class PlatformScope {
    Any,
    DarwinOnly, // 只有 Darwin 上才能直接绑定的签名（结构体按值传递）
};

// 解析 name 并写入类型化的函数指针槽位。
// Fn 必须是函数类型，签名不匹配在编译期报错
template <typename Fn>
Status bindFunction(Fn*& slot, const SymbolRegistry& registry, NativeHandle handle,
                    std::string_view name, Requirement requirement) {
    static_assert(std::is_function<Fn>::value, "slot must be a function pointer");

    SymbolBinding binding = registry.resolve(name, handle);
    if (!binding.valid()) {
        slot = nullptr;
        if (requirement == Requirement::Required) {
            LOGE("Required symbol not found: " SV_FMT, SV_ARG(name));
            return Status(ErrorCode::SymbolNotFound,
                          "required symbol " + std::string(name) + " not found in " +
                          std::to_string(registry.size()) + " loaded module(s)");
        }
        LOGD("Optional symbol not available: " SV_FMT, SV_ARG(name));
        return Status::OK();
    }

    slot = reinterpret_cast<Fn*>(binding.address);
    return Status::OK();
}

template <typename Fn>
Status bindRequired(Fn*& slot, const SymbolRegistry& registry, NativeHandle handle,
                    std::string_view name) {
    return bindFunction(slot, registry, handle, name, Requirement::Required);
}

// 不传播错误，返回是否绑定成功；调用方在使用前必须检查槽位是否为 nullptr
template <typename Fn>
bool bindOptional(Fn*& slot, const SymbolRegistry& registry, NativeHandle handle,
                  std::string_view name) {
    Status status = bindFunction(slot, registry, handle, name, Requirement::Optional);
    return status.ok() && slot != nullptr;
}

// 批量绑定条目。assign 捕获类型化槽位，传入 nullptr 即复位
struct BindSpec {
    std::string name;
    Requirement requirement = Requirement::Required;
    PlatformScope scope = PlatformScope::Any;
    std::function<void(void*)> assign;
};

template <typename Fn>
BindSpec bindSpec(Fn*& slot, std::string name,
                  Requirement requirement = Requirement::Required,
                  PlatformScope scope = PlatformScope::Any) {
    static_assert(std::is_function<Fn>::value, "slot must be a function pointer");

    BindSpec spec;
    spec.name = std::move(name);
    spec.requirement = requirement;
    spec.scope = scope;
    Fn** target = &slot;
    spec.assign = [target](void* address) { *target = reinterpret_cast<Fn*>(address); };
    return spec;
}

// 当前平台是否需要处理该条目
bool inScope(PlatformScope scope);

// 逐条独立绑定，不回滚已绑定的槽位。
// 所有必需符号都会尝试一遍，缺失的名字汇总在返回的 SymbolNotFound 中
Status bindSet(const SymbolRegistry& registry, NativeHandle handle,
               const std::vector<BindSpec>& specs);

// 把所有条目的槽位复位为 nullptr
void resetSet(const std::vector<BindSpec>& specs);

} // namespace llamaload
