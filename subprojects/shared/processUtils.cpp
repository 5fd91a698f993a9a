#include "processUtils.hpp"

#include <functional>
#include <pthread.h>
#include <thread>

#if defined(__linux__)
#include <sys/syscall.h>
#include <unistd.h>
#endif

uint64_t ProcessUtils::get_native_thread_id() {
#if defined(__linux__)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#elif defined(__APPLE__)
    uint64_t thread_id = 0;
    pthread_threadid_np(nullptr, &thread_id);
    return thread_id;
#else
    return std::hash<std::thread::id>{}(std::this_thread::get_id());
#endif
}

bool ProcessUtils::set_current_thread_name(const std::string& name) {
#if defined(__APPLE__)
    return pthread_setname_np(name.c_str()) == 0;
#elif defined(__linux__)
    std::string truncated = name.substr(0, 15);
    return pthread_setname_np(pthread_self(), truncated.c_str()) == 0;
#else
    (void)name;
    return false;
#endif
}
