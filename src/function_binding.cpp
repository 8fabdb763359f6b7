// llamaload - Function Registration Implementation

#include "function_binding.hpp"

namespace llamaload {

bool inScope(PlatformScope scope) {
    switch (scope) {
    case PlatformScope::Any:        return true;
    case PlatformScope::DarwinOnly: return kIsDarwin;
    }
    return false;
}

Status bindSet(const SymbolRegistry& registry, NativeHandle handle,
               const std::vector<BindSpec>& specs) {
    std::string missing;
    size_t missing_count = 0;
    size_t bound = 0;
    size_t skipped = 0;

    for (const auto& spec : specs) {
        if (!inScope(spec.scope)) {
            skipped++;
            continue;
        }

        SymbolBinding binding = registry.resolve(spec.name, handle);
        if (binding.valid()) {
            spec.assign(binding.address);
            bound++;
            continue;
        }

        spec.assign(nullptr);
        if (spec.requirement == Requirement::Required) {
            LOGE("Required symbol not found: %s", spec.name.c_str());
            if (!missing.empty()) missing += ", ";
            missing += spec.name;
            missing_count++;
        } else {
            LOGD("Optional symbol not available: %s", spec.name.c_str());
        }
    }

    LOGI("Bound %zu/%zu function(s), %zu skipped for this platform",
         bound, specs.size(), skipped);

    if (missing_count) {
        return Status(ErrorCode::SymbolNotFound,
                      std::to_string(missing_count) + " required symbol(s) not found: " + missing);
    }
    return Status::OK();
}

void resetSet(const std::vector<BindSpec>& specs) {
    for (const auto& spec : specs) {
        spec.assign(nullptr);
    }
}

} // namespace llamaload
