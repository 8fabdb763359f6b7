// llamaload - Symbol Registry Implementation

#include "symbol_registry.hpp"
#include "log.hpp"
#include <algorithm>

namespace llamaload {

bool SymbolRegistry::registerHandle(NativeHandle handle) {
    if (handle == kInvalidHandle) return false;
    if (contains(handle)) return false;

    handles_.push_back(handle);
    LOGD("Registered handle 0x%zx (%zu total)", static_cast<size_t>(handle), handles_.size());
    return true;
}

bool SymbolRegistry::contains(NativeHandle handle) const {
    return std::find(handles_.begin(), handles_.end(), handle) != handles_.end();
}

SymbolBinding SymbolRegistry::resolve(std::string_view name, NativeHandle preferred) const {
    SymbolBinding binding;
    binding.name = std::string(name);

    if (preferred != kInvalidHandle) {
        if (void* addr = loader_.resolve(preferred, name)) {
            binding.address = addr;
            binding.owner = preferred;
            return binding;
        }
    }

    // 在兄弟模块中查找
    for (size_t i = 0; i < handles_.size(); i++) {
        NativeHandle handle = handles_[i];
        if (handle == preferred) continue;

        if (void* addr = loader_.resolve(handle, name)) {
            LOGD("Symbol '" SV_FMT "' found in sibling #%zu (0x%zx)",
                 SV_ARG(name), i, static_cast<size_t>(handle));
            binding.address = addr;
            binding.owner = handle;
            return binding;
        }
    }

    LOGD("Symbol '" SV_FMT "' not found in %zu handle(s)", SV_ARG(name), handles_.size());
    return binding;
}

} // namespace llamaload
