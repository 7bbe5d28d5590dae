#include <linepipe/common/platform.hpp>

#include <cstdlib>

#if defined(LINEPIPE_OS_WINDOWS)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <io.h>
#include <windows.h>
#elif defined(LINEPIPE_OS_POSIX)
#include <pthread.h>
#include <unistd.h>
#endif

namespace linepipe::common::platform {

// ============================================================================
// Thread Identification
// ============================================================================

uint64_t get_thread_id() noexcept {
#if defined(LINEPIPE_OS_WINDOWS)
    return static_cast<uint64_t>(GetCurrentThreadId());
#elif defined(LINEPIPE_OS_MACOS)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(LINEPIPE_OS_POSIX)
    return static_cast<uint64_t>(pthread_self());
#else
    return 0;
#endif
}

// ============================================================================
// Environment Variables
// ============================================================================

std::string get_env(std::string_view name) {
    std::string name_str(name);
#if defined(LINEPIPE_OS_WINDOWS)
    char buffer[32767];
    DWORD result = GetEnvironmentVariableA(name_str.c_str(), buffer, sizeof(buffer));
    if (result > 0 && result < sizeof(buffer)) {
        return std::string(buffer);
    }
    return {};
#else
    const char* value = std::getenv(name_str.c_str());
    return value ? std::string(value) : std::string{};
#endif
}

// ============================================================================
// Terminal Detection
// ============================================================================

bool is_terminal(std::FILE* stream) noexcept {
    if (!stream) {
        return false;
    }
#if defined(LINEPIPE_OS_WINDOWS)
    return _isatty(_fileno(stream)) != 0;
#elif defined(LINEPIPE_OS_POSIX)
    return isatty(fileno(stream)) != 0;
#else
    return false;
#endif
}

}  // namespace linepipe::common::platform
