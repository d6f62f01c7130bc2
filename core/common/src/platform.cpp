#include <confix/common/platform.hpp>

#include <cstdlib>
#include <cstring>

#if defined(CONFIX_OS_WINDOWS)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#elif defined(CONFIX_OS_POSIX)
#include <pthread.h>
#include <unistd.h>
extern char** environ;
#endif

namespace confix::common::platform {

// ============================================================================
// Thread ID
// ============================================================================

uint64_t get_thread_id() noexcept {
#if defined(CONFIX_OS_WINDOWS)
    return static_cast<uint64_t>(GetCurrentThreadId());
#elif defined(CONFIX_OS_MACOS)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(CONFIX_OS_POSIX)
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
#if defined(CONFIX_OS_WINDOWS)
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

bool set_env(std::string_view name, std::string_view value) {
    std::string name_str(name);
    std::string value_str(value);
#if defined(CONFIX_OS_WINDOWS)
    return SetEnvironmentVariableA(name_str.c_str(), value_str.c_str()) != 0;
#elif defined(CONFIX_OS_POSIX)
    return setenv(name_str.c_str(), value_str.c_str(), 1) == 0;
#else
    return false;
#endif
}

bool unset_env(std::string_view name) {
    std::string name_str(name);
#if defined(CONFIX_OS_WINDOWS)
    return SetEnvironmentVariableA(name_str.c_str(), nullptr) != 0 ||
           GetLastError() == ERROR_ENVVAR_NOT_FOUND;
#elif defined(CONFIX_OS_POSIX)
    return unsetenv(name_str.c_str()) == 0;
#else
    return false;
#endif
}

std::map<std::string, std::string> get_environment() {
    std::map<std::string, std::string> result;

#if defined(CONFIX_OS_WINDOWS)
    LPCH block = GetEnvironmentStringsA();
    if (!block) {
        return result;
    }
    for (const char* entry = block; *entry != '\0'; entry += std::strlen(entry) + 1) {
        std::string_view line(entry);
        auto pos = line.find('=');
        // Entries such as "=C:=C:\\" describe drive state, not variables
        if (pos == std::string_view::npos || pos == 0) {
            continue;
        }
        result.emplace(std::string(line.substr(0, pos)), std::string(line.substr(pos + 1)));
    }
    FreeEnvironmentStringsA(block);
#elif defined(CONFIX_OS_POSIX)
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view line(*entry);
        auto pos = line.find('=');
        if (pos == std::string_view::npos) {
            continue;
        }
        result.emplace(std::string(line.substr(0, pos)), std::string(line.substr(pos + 1)));
    }
#endif

    return result;
}

} // namespace confix::common::platform
