// llamaload - POSIX Platform Implementation

#include "platform.hpp"

#if defined(LLAMALOAD_PLATFORM_POSIX)

#include "log.hpp"
#include <dlfcn.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace llamaload {
namespace platform {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// dlerror() 只给出文本，按已知的 glibc / dyld 措辞归类
LoadFailure classifyDlError(const std::string& path, const std::string& err) {
    if (contains(err, "invalid ELF header") ||
        contains(err, "wrong ELF class") ||
        contains(err, "file too short") ||
        contains(err, "ELF file's phentsize") ||
        contains(err, "ELF load command") ||
        contains(err, "incompatible architecture") ||
        contains(err, "wrong architecture") ||
        contains(err, "not a mach-o file")) {
        return LoadFailure::ArchitectureMismatch;
    }

    if (contains(err, "undefined symbol") || contains(err, "Symbol not found")) {
        return LoadFailure::DependencyMissing;
    }

    // "<name>: cannot open shared object file"，name 不是主库时说明缺的是依赖
    if (contains(err, "cannot open shared object file") || contains(err, "Library not loaded")) {
        if (err.compare(0, path.size(), path) != 0) {
            return LoadFailure::DependencyMissing;
        }
        return LoadFailure::FileNotFound;
    }

    return LoadFailure::Unknown;
}

} // namespace

Status openModule(const std::string& path, NativeHandle& out, bool /*add_search_dir*/) {
    out = kInvalidHandle;

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        int err = errno;
        LOGE("Library file not found: %s", path.c_str());
        return Status(ErrorCode::LoadFailed,
                      "cannot access " + path + ": " + strerror(err),
                      LoadFailure::FileNotFound, err);
    }

    if (!S_ISREG(st.st_mode)) {
        LOGE("Not a regular file: %s", path.c_str());
        return Status(ErrorCode::LoadFailed, "not a regular file: " + path,
                      LoadFailure::FileNotFound);
    }

    if (access(path.c_str(), R_OK) != 0) {
        int err = errno;
        LOGE("Library file not readable: %s", path.c_str());
        return Status(ErrorCode::LoadFailed,
                      "cannot read " + path + ": " + strerror(err),
                      LoadFailure::Unknown, err);
    }

    // RTLD_GLOBAL 让后续打开的兄弟模块能解析到已加载模块的导出
    dlerror();
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_GLOBAL);
    if (!handle) {
        const char* raw = dlerror();
        std::string err = raw ? raw : "dlopen failed";
        LoadFailure failure = classifyDlError(path, err);
        LOGE("dlopen failed for %s: %s", path.c_str(), err.c_str());
        return Status(ErrorCode::LoadFailed, "dlopen " + path + ": " + err, failure);
    }

    out = reinterpret_cast<NativeHandle>(handle);
    LOGD("Opened %s -> %p", path.c_str(), handle);
    return Status::OK();
}

Status closeModule(NativeHandle handle) {
    if (handle == kInvalidHandle) {
        return Status(ErrorCode::CloseFailed, "invalid handle");
    }

    dlerror();
    if (dlclose(reinterpret_cast<void*>(handle)) != 0) {
        const char* raw = dlerror();
        std::string err = raw ? raw : "dlclose failed";
        LOGW("dlclose(%p) failed: %s", reinterpret_cast<void*>(handle), err.c_str());
        return Status(ErrorCode::CloseFailed, err);
    }
    return Status::OK();
}

void* findSymbol(NativeHandle handle, std::string_view name) {
    if (handle == kInvalidHandle) return nullptr;

    std::string symbol(name);
    dlerror();
    void* addr = dlsym(reinterpret_cast<void*>(handle), symbol.c_str());
    // 清掉 dlerror 状态，调试构建顺带记录原因
    const char* raw = dlerror();
    if (!addr) {
        LOGD("dlsym(%s) failed: %s", symbol.c_str(), raw ? raw : "null address");
    }
    (void)raw;
    return addr;
}

const char* libraryExtension() {
#if defined(LLAMALOAD_PLATFORM_DARWIN)
    return ".dylib";
#else
    return ".so";
#endif
}

std::string moduleFileName(std::string_view base) {
    return "lib" + std::string(base) + libraryExtension();
}

std::string platformKey() {
#if defined(LLAMALOAD_PLATFORM_DARWIN)
    std::string key = "darwin_";
#elif defined(__linux__)
    std::string key = "linux_";
#elif defined(__FreeBSD__)
    std::string key = "freebsd_";
#else
    std::string key = "unix_";
#endif

#if defined(__x86_64__)
    key += "amd64";
#elif defined(__aarch64__)
    key += "arm64";
#elif defined(__i386__)
    key += "386";
#elif defined(__arm__)
    key += "arm";
#else
    key += "unknown";
#endif
    return key;
}

} // namespace platform
} // namespace llamaload

#endif
