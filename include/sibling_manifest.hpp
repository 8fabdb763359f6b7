// llamaload - Sibling Module Manifest
#pragma once

#include <string>
#include <vector>

namespace llamaload {

// 与主库同目录、按优先级预加载的兄弟模块清单。
// 排在前面的模块导出其他模块在自身加载时就需要的符号（例如 ggml-base）
struct SiblingManifest {
    std::string version;
    std::vector<std::string> modules;   // 文件名（含平台前缀与扩展名）
};

// 当前平台的默认清单
SiblingManifest defaultSiblingManifest();

// 返回 dir 中应当预加载的兄弟模块完整路径：
// 先是清单中实际存在的文件（按清单顺序），再是目录中其余同扩展名文件（按文件名排序）。
// 主库本身与子目录会被跳过
std::vector<std::string> listSiblingModules(const std::string& dir,
                                            const std::string& primary_name,
                                            const SiblingManifest& manifest);

} // namespace llamaload
