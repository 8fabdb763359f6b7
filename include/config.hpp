// llamaload - Configuration
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace llamaload {

// 只影响库文件的定位与兄弟模块预加载，绑定层本身不读取配置
struct Config {
    std::string library_path;       // 显式指定的主库路径，优先级最高
    std::string version;            // 例如 "b6862"；为空表示不限版本
    std::string cache_dir;          // 缓存目录覆盖
    bool use_embedded = false;      // 强制使用内嵌库包
    std::string embedded_dir;       // 内嵌库包根目录
    std::optional<bool> preload_siblings; // 未设置时沿用平台默认值

    // LLAMALOAD_LIBRARY_PATH / _VERSION / _CACHE_DIR / _USE_EMBEDDED /
    // _EMBEDDED_DIR / _PRELOAD_SIBLINGS
    static Config fromEnvironment();
};

// 1/true/yes/on 与 0/false/no/off，大小写不敏感；其他值返回 nullopt
std::optional<bool> parseBool(std::string_view value);

} // namespace llamaload
