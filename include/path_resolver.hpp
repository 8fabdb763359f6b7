// llamaload - Artifact Resolution
#pragma once

#include "config.hpp"
#include "status.hpp"
#include <string>
#include <vector>

namespace llamaload {

struct ResolvedArtifact {
    std::string path;           // 主库文件
    std::string scratch_dir;    // 非空时由加载器在卸载时删除
};

class PathResolver {
public:
    virtual ~PathResolver() = default;
    virtual Status resolve(ResolvedArtifact& out) const = 0;
};

// 固定路径，不检查文件是否存在（由加载步骤报告）
class FixedPathResolver : public PathResolver {
public:
    explicit FixedPathResolver(std::string path) : path_(std::move(path)) {}
    Status resolve(ResolvedArtifact& out) const override;

private:
    std::string path_;
};

// 按配置在本地查找：显式路径 -> 内嵌库包 -> 缓存目录 -> 工作目录与系统目录
class ConfigPathResolver : public PathResolver {
public:
    explicit ConfigPathResolver(Config config) : config_(std::move(config)) {}
    Status resolve(ResolvedArtifact& out) const override;

    const Config& config() const { return config_; }

    // 缓存根目录：配置覆盖，否则 XDG_CACHE_HOME / ~/.cache / %LOCALAPPDATA% 下的 llamaload/libs
    std::string cacheRoot() const;

private:
    Status extractEmbedded(ResolvedArtifact& out, std::vector<std::string>& tried) const;
    bool findInCache(std::string& out, std::vector<std::string>& tried) const;
    bool findInWorkingDirs(std::string& out, std::vector<std::string>& tried) const;

    Config config_;
};

// "libllama.so" / "libllama.dylib" / "llama.dll"
std::string primaryLibraryName();

// 删除临时目录，失败只记录日志
void removeScratchDirectory(const std::string& dir);

} // namespace llamaload
