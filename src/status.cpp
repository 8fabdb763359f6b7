// llamaload - Status Implementation

#include "status.hpp"

namespace llamaload {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::Ok:                   return "Ok";
    case ErrorCode::ArtifactUnavailable:  return "ArtifactUnavailable";
    case ErrorCode::LoadFailed:           return "LoadFailed";
    case ErrorCode::SymbolNotFound:       return "SymbolNotFound";
    case ErrorCode::UnsupportedSignature: return "UnsupportedSignature";
    case ErrorCode::CloseFailed:          return "CloseFailed";
    case ErrorCode::NotLoaded:            return "NotLoaded";
    case ErrorCode::FunctionUnavailable:  return "FunctionUnavailable";
    case ErrorCode::InvalidArgument:      return "InvalidArgument";
    }
    return "Unknown";
}

const char* loadFailureName(LoadFailure failure) {
    switch (failure) {
    case LoadFailure::None:                 return "None";
    case LoadFailure::FileNotFound:         return "FileNotFound";
    case LoadFailure::DependencyMissing:    return "DependencyMissing";
    case LoadFailure::ArchitectureMismatch: return "ArchitectureMismatch";
    case LoadFailure::Unknown:              return "Unknown";
    }
    return "Unknown";
}

Status& Status::prepend(const std::string& context) {
    if (message_.empty()) {
        message_ = context;
    } else {
        message_ = context + ": " + message_;
    }
    return *this;
}

std::string Status::toString() const {
    if (ok()) return "Ok";

    std::string out = errorCodeName(code_);
    if (failure_ != LoadFailure::None) {
        out += "/";
        out += loadFailureName(failure_);
    }
    out += ": ";
    out += message_;
    if (platform_code_ != 0) {
        out += " (platform error " + std::to_string(platform_code_) + ")";
    }
    return out;
}

} // namespace llamaload
