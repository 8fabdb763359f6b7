// llamaload - 测试用模块 A：不导出 fallback_symbol
#include "fixture_export.hpp"

FIXTURE_API const char* module_name() {
    return "A";
}

FIXTURE_API int module_a_only() {
    return 1;
}
