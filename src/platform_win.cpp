// llamaload - Windows Platform Implementation

#include "platform.hpp"

#if defined(LLAMALOAD_PLATFORM_WINDOWS)

#include "log.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <memory>

namespace llamaload {
namespace platform {

namespace {

#ifndef LOAD_LIBRARY_SEARCH_DLL_LOAD_DIR
#define LOAD_LIBRARY_SEARCH_DLL_LOAD_DIR    0x00000100
#endif
#ifndef LOAD_LIBRARY_SEARCH_USER_DIRS
#define LOAD_LIBRARY_SEARCH_USER_DIRS       0x00000400
#endif
#ifndef LOAD_LIBRARY_SEARCH_SYSTEM32
#define LOAD_LIBRARY_SEARCH_SYSTEM32        0x00000800
#endif
#ifndef LOAD_LIBRARY_SEARCH_DEFAULT_DIRS
#define LOAD_LIBRARY_SEARCH_DEFAULT_DIRS    0x00001000
#endif

constexpr DWORD kSafeSearchFlags = LOAD_LIBRARY_SEARCH_DLL_LOAD_DIR |
                                   LOAD_LIBRARY_SEARCH_DEFAULT_DIRS |
                                   LOAD_LIBRARY_SEARCH_USER_DIRS |
                                   LOAD_LIBRARY_SEARCH_SYSTEM32;

using AddDllDirectoryFn = void* (WINAPI*)(PCWSTR);
using RemoveDllDirectoryFn = BOOL (WINAPI*)(void*);

std::wstring toWide(const std::string& utf8) {
    if (utf8.empty()) return std::wstring();
    int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    if (len <= 0) return std::wstring();
    std::wstring wide(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), &wide[0], len);
    return wide;
}

std::string formatError(DWORD code) {
    char* buffer = nullptr;
    DWORD len = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                               FORMAT_MESSAGE_IGNORE_INSERTS,
                               nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string text = (len && buffer) ? std::string(buffer, len) : "error " + std::to_string(code);
    if (buffer) LocalFree(buffer);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::string parentDirectory(const std::string& path) {
    size_t pos = path.find_last_of("\\/");
    return pos == std::string::npos ? std::string(".") : path.substr(0, pos);
}

// 打开期间临时扩展 DLL 搜索路径，析构时撤销。
// 优先使用只作用于带 LOAD_LIBRARY_SEARCH_USER_DIRS 的加载的 AddDllDirectory，
// 不可用时回退到进程级的 SetDllDirectoryW
class ScopedDllDirectory {
public:
    explicit ScopedDllDirectory(const std::string& dir) {
        std::wstring wide = toWide(dir);
        if (wide.empty()) return;

        HMODULE kernel32 = GetModuleHandleW(L"kernel32.dll");
        if (kernel32) {
            add_ = reinterpret_cast<AddDllDirectoryFn>(GetProcAddress(kernel32, "AddDllDirectory"));
            remove_ = reinterpret_cast<RemoveDllDirectoryFn>(GetProcAddress(kernel32, "RemoveDllDirectory"));
        }

        if (add_ && remove_) {
            cookie_ = add_(wide.c_str());
            if (cookie_) {
                LOGD("AddDllDirectory(%s) -> %p", dir.c_str(), cookie_);
                return;
            }
            LOGW("AddDllDirectory(%s) failed: %lu", dir.c_str(), GetLastError());
        }

        if (SetDllDirectoryW(wide.c_str())) {
            process_wide_ = true;
            LOGD("SetDllDirectoryW(%s) fallback", dir.c_str());
        } else {
            LOGW("SetDllDirectoryW(%s) failed: %lu", dir.c_str(), GetLastError());
        }
    }

    ~ScopedDllDirectory() {
        if (cookie_ && remove_) {
            if (!remove_(cookie_)) {
                LOGW("RemoveDllDirectory failed: %lu", GetLastError());
            }
        }
        if (process_wide_) {
            SetDllDirectoryW(nullptr);
        }
    }

    ScopedDllDirectory(const ScopedDllDirectory&) = delete;
    ScopedDllDirectory& operator=(const ScopedDllDirectory&) = delete;

private:
    AddDllDirectoryFn add_ = nullptr;
    RemoveDllDirectoryFn remove_ = nullptr;
    void* cookie_ = nullptr;
    bool process_wide_ = false;
};

Status loadFailure(const std::string& path, DWORD code, const std::string& previous) {
    LoadFailure failure = LoadFailure::Unknown;
    std::string message;

    switch (code) {
    case ERROR_FILE_NOT_FOUND:
    case ERROR_PATH_NOT_FOUND:
        failure = LoadFailure::FileNotFound;
        message = "file not found: " + path;
        break;
    case ERROR_MOD_NOT_FOUND:
        failure = LoadFailure::DependencyMissing;
        message = "a dependency DLL of " + path + " is missing (directory: " +
                  parentDirectory(path) + ")";
        break;
    case ERROR_BAD_EXE_FORMAT:
        failure = LoadFailure::ArchitectureMismatch;
        message = path + " is not a valid module for this process architecture";
        break;
    default:
        message = "LoadLibrary failed for " + path;
        break;
    }

    message += ": " + formatError(code);
    if (!previous.empty()) {
        message += "; previous attempt: " + previous;
    }
    return Status(ErrorCode::LoadFailed, message, failure, static_cast<long>(code));
}

} // namespace

Status openModule(const std::string& path, NativeHandle& out, bool add_search_dir) {
    out = kInvalidHandle;

    std::wstring wide = toWide(path);
    if (wide.empty()) {
        return Status(ErrorCode::LoadFailed, "cannot convert path to UTF-16: " + path,
                      LoadFailure::FileNotFound);
    }

    // 搜索路径只在本次打开期间有效，成功或失败都会撤销
    std::unique_ptr<ScopedDllDirectory> scoped;
    if (add_search_dir) {
        scoped.reset(new ScopedDllDirectory(parentDirectory(path)));
    }

    std::string previous;
    HMODULE module = LoadLibraryExW(wide.c_str(), nullptr, kSafeSearchFlags);
    if (!module) {
        DWORD code = GetLastError();
        previous = "LoadLibraryExW: " + formatError(code);
        LOGD("LoadLibraryExW failed for %s (%lu), trying LoadLibraryW", path.c_str(), code);

        module = LoadLibraryW(wide.c_str());
        if (!module) {
            code = GetLastError();
            LOGE("LoadLibraryW failed for %s (%lu)", path.c_str(), code);
            return loadFailure(path, code, previous);
        }
    }

    out = reinterpret_cast<NativeHandle>(module);
    LOGD("Opened %s -> %p", path.c_str(), static_cast<void*>(module));
    return Status::OK();
}

Status closeModule(NativeHandle handle) {
    if (handle == kInvalidHandle) {
        return Status(ErrorCode::CloseFailed, "invalid handle");
    }
    if (!FreeLibrary(reinterpret_cast<HMODULE>(handle))) {
        DWORD code = GetLastError();
        LOGW("FreeLibrary failed: %lu", code);
        return Status(ErrorCode::CloseFailed, "FreeLibrary: " + formatError(code),
                      LoadFailure::None, static_cast<long>(code));
    }
    return Status::OK();
}

void* findSymbol(NativeHandle handle, std::string_view name) {
    if (handle == kInvalidHandle) return nullptr;

    std::string symbol(name);
    FARPROC proc = GetProcAddress(reinterpret_cast<HMODULE>(handle), symbol.c_str());
    if (!proc) {
        LOGD("GetProcAddress(%s) failed: %lu", symbol.c_str(), GetLastError());
        return nullptr;
    }
    return reinterpret_cast<void*>(proc);
}

const char* libraryExtension() {
    return ".dll";
}

std::string moduleFileName(std::string_view base) {
    return std::string(base) + libraryExtension();
}

std::string platformKey() {
#if defined(_M_ARM64) || defined(__aarch64__)
    return "windows_arm64";
#elif defined(_M_X64) || defined(__x86_64__)
    return "windows_amd64";
#else
    return "windows_386";
#endif
}

} // namespace platform
} // namespace llamaload

#endif
