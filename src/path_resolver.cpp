// llamaload - Artifact Resolution Implementation

#include "path_resolver.hpp"
#include "log.hpp"
#include "platform.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <random>

namespace fs = std::filesystem;

namespace llamaload {

namespace {

bool isRegularFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<fs::path> sortedSubdirectories(const fs::path& dir) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            dirs.push_back(it->path());
        }
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

// <dir>/build/bin/<name>, <dir>/bin/<name>, <dir>/<name>
bool probeLayouts(const fs::path& dir, const std::string& name, std::string& out,
                  std::vector<std::string>& tried) {
    const fs::path candidates[] = {
        dir / "build" / "bin" / name,
        dir / "bin" / name,
        dir / name,
    };
    for (const auto& candidate : candidates) {
        tried.push_back(candidate.string());
        if (isRegularFile(candidate)) {
            out = candidate.string();
            return true;
        }
    }
    return false;
}

std::string makeScratchDirectory() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        ECLOGE(ec, "No temp directory");
        return {};
    }

    std::random_device rd;
    std::mt19937_64 rng(rd() ^ static_cast<uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count()));

    for (int attempt = 0; attempt < 8; attempt++) {
        fs::path dir = base / ("llamaload-" + std::to_string(rng() & 0xffffffffu));
        std::error_code create_ec;
        if (fs::create_directory(dir, create_ec)) {
            return dir.string();
        }
        if (create_ec) {
            ECLOGW(create_ec, "create_directory %s", dir.string().c_str());
        }
    }
    LOGE("Failed to create scratch directory under %s", base.string().c_str());
    return {};
}

std::string joinTried(const std::vector<std::string>& tried) {
    std::string joined;
    for (const auto& entry : tried) {
        if (!joined.empty()) joined += ", ";
        joined += entry;
    }
    return joined;
}

} // namespace

std::string primaryLibraryName() {
    return platform::moduleFileName("llama");
}

void removeScratchDirectory(const std::string& dir) {
    if (dir.empty()) return;

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        ECLOGW(ec, "Failed to remove scratch directory %s", dir.c_str());
        return;
    }
    LOGD("Removed scratch directory %s", dir.c_str());
}

// ==================== FixedPathResolver ====================

Status FixedPathResolver::resolve(ResolvedArtifact& out) const {
    if (path_.empty()) {
        return Status(ErrorCode::ArtifactUnavailable, "no library path configured");
    }
    out.path = path_;
    out.scratch_dir.clear();
    return Status::OK();
}

// ==================== ConfigPathResolver ====================

std::string ConfigPathResolver::cacheRoot() const {
    if (!config_.cache_dir.empty()) {
        return config_.cache_dir;
    }

    fs::path base;
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* local = std::getenv("LOCALAPPDATA"); kIsWindows && local && *local) {
        base = local;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = fs::path(home) / ".cache";
    } else {
        return {};
    }
    return (base / "llamaload" / "libs").string();
}

Status ConfigPathResolver::resolve(ResolvedArtifact& out) const {
    out = ResolvedArtifact();
    std::vector<std::string> tried;

    if (!config_.library_path.empty()) {
        if (isRegularFile(config_.library_path)) {
            out.path = config_.library_path;
            LOGI("Using configured library %s", out.path.c_str());
            return Status::OK();
        }
        return Status(ErrorCode::ArtifactUnavailable,
                      "configured library path does not exist: " + config_.library_path);
    }

    if (config_.use_embedded) {
        return extractEmbedded(out, tried);
    }

    std::string found;
    if (findInCache(found, tried) || findInWorkingDirs(found, tried)) {
        out.path = found;
        LOGI("Resolved library %s", out.path.c_str());
        return Status::OK();
    }

    return Status(ErrorCode::ArtifactUnavailable,
                  primaryLibraryName() + " not found; tried: " + joinTried(tried));
}

Status ConfigPathResolver::extractEmbedded(ResolvedArtifact& out,
                                           std::vector<std::string>& tried) const {
    if (config_.embedded_dir.empty()) {
        return Status(ErrorCode::ArtifactUnavailable, "embedded bundle requested but no bundle root set");
    }

    std::string key = platform::platformKey();
    if (!config_.version.empty()) {
        key += "_" + config_.version;
    }
    const fs::path bundle = fs::path(config_.embedded_dir) / key;
    const std::string name = primaryLibraryName();
    tried.push_back((bundle / name).string());

    if (!isRegularFile(bundle / name)) {
        return Status(ErrorCode::ArtifactUnavailable,
                      "embedded bundle has no " + name + ": " + bundle.string());
    }

    std::string scratch = makeScratchDirectory();
    if (scratch.empty()) {
        return Status(ErrorCode::ArtifactUnavailable, "cannot create scratch directory");
    }

    const std::string ext = platform::libraryExtension();
    size_t copied = 0;
    std::error_code ec;
    for (fs::directory_iterator it(bundle, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || it->path().extension() != ext) {
            continue;
        }

        std::error_code copy_ec;
        fs::copy_file(it->path(), fs::path(scratch) / it->path().filename(),
                      fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            removeScratchDirectory(scratch);
            return Status(ErrorCode::ArtifactUnavailable,
                          "failed to extract " + it->path().string() + ": " + copy_ec.message());
        }
        copied++;
    }
    if (ec) {
        removeScratchDirectory(scratch);
        return Status(ErrorCode::ArtifactUnavailable,
                      "cannot read embedded bundle " + bundle.string() + ": " + ec.message());
    }

    out.path = (fs::path(scratch) / name).string();
    out.scratch_dir = scratch;
    LOGI("Extracted %zu embedded module(s) to %s", copied, scratch.c_str());
    return Status::OK();
}

bool ConfigPathResolver::findInCache(std::string& out, std::vector<std::string>& tried) const {
    const std::string root = cacheRoot();
    if (root.empty() || !isDirectory(root)) {
        if (!root.empty()) tried.push_back(root);
        return false;
    }

    const std::string name = primaryLibraryName();
    std::vector<fs::path> entries;
    if (!config_.version.empty()) {
        entries.push_back(fs::path(root) / config_.version);
    } else {
        entries = sortedSubdirectories(root);
    }

    for (const auto& entry : entries) {
        if (!isDirectory(entry)) {
            tried.push_back(entry.string());
            continue;
        }
        if (probeLayouts(entry, name, out, tried)) {
            return true;
        }
        // 解压后常多一层目录
        for (const auto& nested : sortedSubdirectories(entry)) {
            if (nested.filename() == "build" || nested.filename() == "bin") continue;
            if (probeLayouts(nested, name, out, tried)) {
                return true;
            }
        }
    }
    return false;
}

bool ConfigPathResolver::findInWorkingDirs(std::string& out, std::vector<std::string>& tried) const {
    const std::string name = primaryLibraryName();

    std::vector<fs::path> candidates = {
        fs::path(".") / name,
        fs::path("libs") / platform::platformKey() / name,
    };
#if defined(LLAMALOAD_PLATFORM_POSIX)
    candidates.push_back(fs::path("/usr/local/lib") / name);
    candidates.push_back(fs::path("/usr/lib") / name);
#if defined(LLAMALOAD_PLATFORM_DARWIN)
    candidates.push_back(fs::path("/opt/homebrew/lib") / name);
#endif
#endif

    for (const auto& candidate : candidates) {
        tried.push_back(candidate.string());
        if (isRegularFile(candidate)) {
            out = candidate.string();
            return true;
        }
    }
    return false;
}

} // namespace llamaload
