#include "progress.state.hh"
#include "macros.hh"

#include <sys/mman.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <new>

namespace {
using Counter = std::atomic<uint64_t>;

// an address-free counter is required for sharing across processes
static_assert(Counter::is_always_lock_free);

Counter*
map_counter()
{
    void* addr = mmap(nullptr,
                      sizeof(Counter),
                      PROT_READ | PROT_WRITE,
                      MAP_SHARED | MAP_ANONYMOUS,
                      -1,
                      0);
    EXPECT(addr != MAP_FAILED,
           "Failed to map progress counter: ",
           std::strerror(errno));

    return new (addr) Counter(0);
}

Counter&
counter()
{
    // mapped once and kept for the life of the process
    static Counter* counter = map_counter();
    return *counter;
}
} // namespace

void
pzarr::ProgressState::set(uint64_t value)
{
    counter().store(value);
}

void
pzarr::ProgressState::increment(uint64_t n)
{
    counter().fetch_add(n);
}

uint64_t
pzarr::ProgressState::read()
{
    return counter().load();
}
