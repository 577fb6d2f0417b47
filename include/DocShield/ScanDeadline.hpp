#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace docshield {

// Installs a wall-clock deadline for scans running on the current thread.
// Parsers and stages poll it; nested deadlines restore the outer one.
class ScanDeadline {
  public:
    using Clock = std::chrono::steady_clock;

    explicit ScanDeadline(Clock::time_point expiry);
    ~ScanDeadline();
    ScanDeadline(const ScanDeadline &) = delete;
    ScanDeadline &operator=(const ScanDeadline &) = delete;

    // Throws ScanTimedOut when the current thread's deadline has passed.
    static void check(const char *where);
    // Cheap form for tight loops: the clock is read every 1024th iteration.
    static void poll(std::size_t iteration, const char *where) {
        if ((iteration & 1023u) == 0) {
            check(where);
        }
    }

  private:
    Clock::time_point expiry;
    const ScanDeadline *previous;
};

} // namespace docshield
