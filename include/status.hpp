// llamaload - Status / Error Codes
#pragma once

#include <string>
#include <utility>

namespace llamaload {

enum class ErrorCode {
    Ok = 0,
    ArtifactUnavailable,    // 上游解析器无法提供库文件
    LoadFailed,             // 模块无法打开
    SymbolNotFound,         // 必需的导出符号缺失
    UnsupportedSignature,   // 无法构建调用计划
    CloseFailed,            // 卸载时关闭句柄失败（非致命）
    NotLoaded,
    FunctionUnavailable,    // 当前构建未导出该函数
    InvalidArgument,
};

// LoadFailed 的细分原因
enum class LoadFailure {
    None = 0,
    FileNotFound,
    DependencyMissing,
    ArchitectureMismatch,   // 架构或文件格式不匹配
    Unknown,
};

const char* errorCodeName(ErrorCode code);
const char* loadFailureName(LoadFailure failure);

class Status {
public:
    Status() = default;
    Status(ErrorCode code, std::string message,
           LoadFailure failure = LoadFailure::None, long platform_code = 0)
        : code_(code), failure_(failure), platform_code_(platform_code),
          message_(std::move(message)) {}

    static Status OK() { return Status(); }

    bool ok() const { return code_ == ErrorCode::Ok; }
    ErrorCode code() const { return code_; }
    LoadFailure failure() const { return failure_; }
    long platformCode() const { return platform_code_; }
    const std::string& message() const { return message_; }

    // 在消息前追加上下文，保留错误码
    Status& prepend(const std::string& context);

    std::string toString() const;

private:
    ErrorCode code_ = ErrorCode::Ok;
    LoadFailure failure_ = LoadFailure::None;
    long platform_code_ = 0;
    std::string message_;
};

} // namespace llamaload
