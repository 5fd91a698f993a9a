#pragma once
#include <cstdint>
#include <string>

// Thread helpers for the relay's background I/O thread (POSIX only; the local stream
// backend already depends on poll(2) and pipes).
class ProcessUtils {
public:
    // Kernel thread id as shown by top/gdb; falls back to a hash of std::thread::id.
    static uint64_t get_native_thread_id();

    // Name the calling thread for debuggers and /proc. Linux truncates to 15 chars.
    // Returns false if the platform refused the name.
    static bool set_current_thread_name(const std::string& name);
};
