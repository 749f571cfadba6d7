#pragma once

#include <unistd.h>
#include <atomic>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace credscan::log {

// Line-oriented writer shared by every worker thread. Each call is one
// locked sequence of write(2) calls so lines from different threads never
// interleave.
class Writer {
public:
    static void print(std::string_view s) { write_all(STDOUT_FILENO, s); }

    static void error(std::string_view s) { write_all(STDERR_FILENO, s); }

private:
    static void write_all(int fd, std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        while (!s.empty()) {
            ssize_t n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

// 0 = info and above, higher values enable debug(level, ...) output.
inline std::atomic<int>& verbosity_level() {
    static std::atomic<int> level{0};
    return level;
}

inline void set_verbosity(int level) { verbosity_level().store(level, std::memory_order_relaxed); }
inline int verbosity() { return verbosity_level().load(std::memory_order_relaxed); }
inline bool enabled(int level) { return level <= verbosity(); }

inline std::atomic<bool>& quiet_flag() {
    static std::atomic<bool> quiet{false};
    return quiet;
}

// Suppresses info and warn output; errors are always written.
inline void set_quiet(bool quiet) { quiet_flag().store(quiet, std::memory_order_relaxed); }

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    Writer::error(std::format("credscan error: {}\n", std::format(fmt, std::forward<Args>(args)...)));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (quiet_flag().load(std::memory_order_relaxed)) return;
    Writer::error(std::format("credscan warn: {}\n", std::format(fmt, std::forward<Args>(args)...)));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (quiet_flag().load(std::memory_order_relaxed)) return;
    Writer::error(std::format("credscan info: {}\n", std::format(fmt, std::forward<Args>(args)...)));
}

template <typename... Args>
void debug(int level, std::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(level)) return;
    Writer::error(std::format("credscan debug[{}]: {}\n", level, std::format(fmt, std::forward<Args>(args)...)));
}

} // namespace credscan::log
