#include <cstdlib>
#include <cstring>
#include <new>
#include <string>

#include "document_engine.hpp"

#define LOG_TAG "DocumentEngineFFI"
#include "log.hpp"

// FFI export macro
#if defined(_WIN32)
#define FFI_EXPORT __declspec(dllexport)
#else
#define FFI_EXPORT __attribute__((visibility("default")))
#endif

namespace {

char* failureJson(ErrorKind kind, const std::string& message) {
    ProcessingOutcome outcome;
    outcome.failure = kind;
    outcome.error_message = message;
    return strdup(toJson(outcome).c_str());
}

}  // namespace

extern "C" {

// Create engine instance. tessdata_path may be null to use TESSDATA_PREFIX.
FFI_EXPORT
void* document_engine_create(const char* tessdata_path) {
    LOGI("Creating DocumentEngine");
    TesseractOptions options;
    if (tessdata_path) {
        options.tessdata_path = tessdata_path;
    }
    try {
        return new DocumentEngine(options);
    } catch (const std::exception& e) {
        LOGE("DocumentEngine creation failed: %s", e.what());
        return nullptr;
    }
}

// Destroy engine instance
FFI_EXPORT
void document_engine_destroy(void* engine) {
    if (engine) {
        LOGI("Destroying DocumentEngine");
        delete static_cast<DocumentEngine*>(engine);
    }
}

// Process an encoded image (PNG, JPEG, ...).
// Returns a JSON string, release it with free_string.
FFI_EXPORT
char* document_engine_process(
    void* engine,
    const uint8_t* image_bytes,
    int length,
    const char* type_hint,  // may be null
    int timeout_ms          // 0 = no limit
) {
    if (!engine || !image_bytes || length <= 0) {
        return failureJson(ErrorKind::InputError, "Invalid parameters");
    }

    DocumentEngine* eng = static_cast<DocumentEngine*>(engine);

    ProcessingOptions options;
    options.timeout_ms = timeout_ms;

    try {
        ProcessingOutcome outcome = eng->process(image_bytes, static_cast<size_t>(length),
                                                 type_hint ? type_hint : "", options);
        return strdup(toJson(outcome).c_str());
    } catch (const cv::Exception& e) {
        LOGE("Image rejected: %s", e.what());
        return failureJson(ErrorKind::InputError, std::string("Image processing failed: ") + e.what());
    } catch (const std::bad_alloc&) {
        LOGE("Out of memory for this image");
        return failureJson(ErrorKind::InputError, "Image too large");
    } catch (const std::exception& e) {
        LOGE("Processing threw: %s", e.what());
        return failureJson(ErrorKind::OcrEngineUnavailable, e.what());
    }
}

// Process raw pixels from a camera frame or decoded bitmap
FFI_EXPORT
char* document_engine_process_buffer(
    void* engine,
    const uint8_t* image_data,
    int width,
    int height,
    int format,  // 0: BGRA, 1: BGR, 2: RGB
    const char* type_hint,
    int timeout_ms
) {
    if (!engine || !image_data || width <= 0 || height <= 0) {
        return failureJson(ErrorKind::InputError, "Invalid parameters");
    }

    DocumentEngine* eng = static_cast<DocumentEngine*>(engine);

    ProcessingOptions options;
    options.timeout_ms = timeout_ms;

    try {
        ProcessingOutcome outcome = eng->processBuffer(image_data, width, height, format,
                                                       type_hint ? type_hint : "", options);
        return strdup(toJson(outcome).c_str());
    } catch (const cv::Exception& e) {
        LOGE("Image rejected: %s", e.what());
        return failureJson(ErrorKind::InputError, std::string("Image processing failed: ") + e.what());
    } catch (const std::bad_alloc&) {
        LOGE("Out of memory for this image");
        return failureJson(ErrorKind::InputError, "Image too large");
    } catch (const std::exception& e) {
        LOGE("Processing threw: %s", e.what());
        return failureJson(ErrorKind::OcrEngineUnavailable, e.what());
    }
}

// Free string returned by document_engine_process*
FFI_EXPORT
void free_string(char* str) {
    if (str) {
        free(str);
    }
}

// Get library version
FFI_EXPORT
const char* get_version() {
    return "0.1.0";
}

}  // extern "C"
