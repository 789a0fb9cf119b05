#ifndef LOG_HPP
#define LOG_HPP

#include <cstdio>

#ifndef LOG_TAG
#define LOG_TAG "DocumentEngine"
#endif

#ifdef __ANDROID__
#include <android/log.h>
#define LOGI(...) __android_log_print(ANDROID_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGE(...) __android_log_print(ANDROID_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#ifdef DOCENGINE_VERBOSE
#define LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, LOG_TAG, __VA_ARGS__)
#else
#define LOGD(...) do {} while(0)
#endif
#else
// Desktop builds: tagged lines on stderr
#define DOCENGINE_LOG_PRINT(level, ...) \
    do { \
        std::fprintf(stderr, "[%s] %s: ", LOG_TAG, level); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fputc('\n', stderr); \
    } while(0)
#define LOGI(...) DOCENGINE_LOG_PRINT("I", __VA_ARGS__)
#define LOGE(...) DOCENGINE_LOG_PRINT("E", __VA_ARGS__)
#ifdef DOCENGINE_VERBOSE
#define LOGD(...) DOCENGINE_LOG_PRINT("D", __VA_ARGS__)
#else
#define LOGD(...) do {} while(0)
#endif
#endif

#endif // LOG_HPP
