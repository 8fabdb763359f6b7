// llamaload - Library Load Orchestrator Implementation

#include "library_loader.hpp"
#include "log.hpp"
#include <mutex>

namespace llamaload {

const char* loadStateName(LoadState state) {
    switch (state) {
    case LoadState::Unloaded: return "Unloaded";
    case LoadState::Loaded:   return "Loaded";
    }
    return "?";
}

LibraryLoader::LibraryLoader(const PathResolver& resolver, SymbolBinder& binder,
                             LoaderOptions options)
    : resolver_(resolver),
      binder_(binder),
      loader_(std::move(options)),
      registry_(loader_) {}

LibraryLoader::~LibraryLoader() {
    Status status = unload();
    if (!status.ok()) {
        LOGW("Unload during destruction: %s", status.toString().c_str());
    }
}

Status LibraryLoader::load() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (state_ == LoadState::Loaded) {
        return Status::OK();
    }
    return loadLocked();
}

Status LibraryLoader::ensureLoaded() {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (state_ == LoadState::Loaded) {
            return Status::OK();
        }
    }
    return load();
}

Status LibraryLoader::loadLocked() {
    ResolvedArtifact artifact;
    Status status = resolver_.resolve(artifact);
    if (!status.ok()) {
        LOGE("Artifact resolution failed: %s", status.toString().c_str());
        return status;
    }

    LOGI("Loading %s", artifact.path.c_str());

    std::vector<NativeHandle> handles;
    status = loader_.open(artifact.path, handles);
    if (!status.ok()) {
        LOGE("Open failed: %s", status.toString().c_str());
        removeScratchDirectory(artifact.scratch_dir);
        // 打开失败的消息里已经带有路径
        return status;
    }

    // 注册必须在任何绑定之前完成
    for (NativeHandle handle : handles) {
        registry_.registerHandle(handle);
    }

    const NativeHandle primary = handles.front();
    status = binder_.bind(registry_, primary);
    if (!status.ok()) {
        LOGE("Binding failed: %s", status.toString().c_str());
        binder_.reset();

        std::string failures;
        if (closeAll(registry_.handles(), failures) > 0) {
            LOGW("Cleanup after failed load: %s", failures.c_str());
        }
        registry_.clear();
        removeScratchDirectory(artifact.scratch_dir);
        return status.prepend(artifact.path);
    }

    state_ = LoadState::Loaded;
    handle_ = primary;
    path_ = artifact.path;
    scratch_dir_ = artifact.scratch_dir;
    session_++;

    LOGI("Loaded %s (handle 0x%zx, %zu module(s), session %llu)",
         path_.c_str(), static_cast<size_t>(handle_), registry_.size(),
         static_cast<unsigned long long>(session_));
    return Status::OK();
}

Status LibraryLoader::unload() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (state_ == LoadState::Unloaded) {
        return Status::OK();
    }
    return unloadLocked();
}

Status LibraryLoader::unloadLocked() {
    // 先复位槽位，避免在关闭过程中留下悬空地址
    binder_.reset();

    std::string failures;
    const size_t failed = closeAll(registry_.handles(), failures);

    registry_.clear();
    removeScratchDirectory(scratch_dir_);

    LOGI("Unloaded %s", path_.c_str());

    state_ = LoadState::Unloaded;
    handle_ = kInvalidHandle;
    path_.clear();
    scratch_dir_.clear();

    if (failed) {
        return Status(ErrorCode::CloseFailed,
                      std::to_string(failed) + " module(s) failed to close: " + failures);
    }
    return Status::OK();
}

size_t LibraryLoader::closeAll(const std::vector<NativeHandle>& handles, std::string& failures) {
    size_t failed = 0;
    // 逆序关闭：依赖方先于被依赖方
    for (auto it = handles.rbegin(); it != handles.rend(); ++it) {
        Status status = loader_.close(*it);
        if (!status.ok()) {
            LOGW("Close 0x%zx: %s", static_cast<size_t>(*it), status.toString().c_str());
            if (!failures.empty()) failures += "; ";
            failures += status.message();
            failed++;
        }
    }
    return failed;
}

bool LibraryLoader::isLoaded() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_ == LoadState::Loaded;
}

LoadState LibraryLoader::state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

NativeHandle LibraryLoader::handle() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handle_;
}

std::string LibraryLoader::path() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return path_;
}

std::vector<NativeHandle> LibraryLoader::handles() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return registry_.handles();
}

uint64_t LibraryLoader::session() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return session_;
}

SymbolBinding LibraryLoader::findSymbol(std::string_view name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (state_ != LoadState::Loaded) {
        SymbolBinding binding;
        binding.name = std::string(name);
        return binding;
    }
    return registry_.resolve(name, handle_);
}

} // namespace llamaload
