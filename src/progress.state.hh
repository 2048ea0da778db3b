#pragma once

#include <cstdint>

namespace pzarr {
/**
 * @brief Process-wide count of bytes written, shared with worker processes.
 * @details The counter lives in an anonymous shared mapping that is created
 * on first use. Worker processes forked after that share it with their
 * parent, so the controller must touch the counter (WorkManager does, via
 * set()) before any worker is started.
 * @note There is one counter per controller process, so only one progress
 * session may run at a time. Running two concurrently corrupts both totals.
 */
class ProgressState
{
  public:
    static void set(uint64_t value);
    static void increment(uint64_t n);
    static uint64_t read();
};
} // namespace pzarr
