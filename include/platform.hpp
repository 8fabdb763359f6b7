// llamaload - Platform Primitives
#pragma once

#include "status.hpp"
#include <cstdint>
#include <string>
#include <string_view>

#if defined(_WIN32)
#define LLAMALOAD_PLATFORM_WINDOWS 1
#else
#define LLAMALOAD_PLATFORM_POSIX 1
#if defined(__APPLE__)
#define LLAMALOAD_PLATFORM_DARWIN 1
#endif
#endif

namespace llamaload {

// 已加载模块的不透明句柄（dlopen 返回值或 HMODULE）
using NativeHandle = uintptr_t;
constexpr NativeHandle kInvalidHandle = 0;

#if defined(LLAMALOAD_PLATFORM_DARWIN)
constexpr bool kIsDarwin = true;
#else
constexpr bool kIsDarwin = false;
#endif

#if defined(LLAMALOAD_PLATFORM_WINDOWS)
constexpr bool kIsWindows = true;
#else
constexpr bool kIsWindows = false;
#endif

namespace platform {

// 打开单个模块。add_search_dir 为 true 时，在打开期间把模块所在目录
// 加入依赖搜索路径（仅 Windows 有效），打开结束后立即撤销
Status openModule(const std::string& path, NativeHandle& out, bool add_search_dir = false);

Status closeModule(NativeHandle handle);

// 找不到时返回 nullptr，原因只写入调试日志
void* findSymbol(NativeHandle handle, std::string_view name);

// ".so" / ".dylib" / ".dll"
const char* libraryExtension();

// "libllama.so" / "libllama.dylib" / "llama.dll"
std::string moduleFileName(std::string_view base);

// "<os>_<arch>"，如 linux_amd64、darwin_arm64、windows_amd64
std::string platformKey();

} // namespace platform
} // namespace llamaload
