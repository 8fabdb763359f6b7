// llamaload - Logging
#pragma once

#include <cstdio>

#ifdef __ANDROID__
#include <android/log.h>
#endif

namespace llamaload {

#define LOG_TAG "llamaload"

#ifdef LLAMALOAD_DEBUG
    #ifdef __ANDROID__
        #define LLAMALOAD_LOG(prio, letter, ...) __android_log_print(ANDROID_LOG_##prio, LOG_TAG, __VA_ARGS__)
    #else
        #define LLAMALOAD_LOG(prio, letter, ...) \
            do { fprintf(stderr, "[" letter "] " LOG_TAG ": " __VA_ARGS__); fprintf(stderr, "\n"); } while(0)
    #endif
    #define LOGD(...) LLAMALOAD_LOG(DEBUG, "D", __VA_ARGS__)
    #define LOGI(...) LLAMALOAD_LOG(INFO, "I", __VA_ARGS__)
    #define LOGW(...) LLAMALOAD_LOG(WARN, "W", __VA_ARGS__)
    #define LOGE(...) LLAMALOAD_LOG(ERROR, "E", __VA_ARGS__)
    // 附带 std::error_code 的描述
    #define ECLOGW(ec, fmt, ...) LOGW(fmt ": %s", ##__VA_ARGS__, (ec).message().c_str())
    #define ECLOGE(ec, fmt, ...) LOGE(fmt ": %s", ##__VA_ARGS__, (ec).message().c_str())
#else
    #define LOGD(...) do {} while(0)
    #define LOGI(...) do {} while(0)
    #define LOGW(...) do {} while(0)
    #define LOGE(...) do {} while(0)
    #define ECLOGW(...) do {} while(0)
    #define ECLOGE(...) do {} while(0)
#endif

// string_view 不保证以 '\0' 结尾
#define SV_FMT "%.*s"
#define SV_ARG(sv) static_cast<int>((sv).size()), (sv).data()

} // namespace llamaload
