#pragma once

#include <tilestream/visibility.hpp>

#include <atomic>
#include <cstdint>

namespace tilestream::os
{

// Raw futex operations, building blocks for the primitives below
namespace Futex
{

// Block until the value at `addr` is observed to differ from `value`.
// Spurious wakeups are possible, callers must re-check in a loop.
TILESTREAM_API void waitInfinite(std::atomic_uint32_t *addr, uint32_t value) noexcept;
// Wake at most one thread blocked on `addr`
TILESTREAM_API void wakeSingle(std::atomic_uint32_t *addr) noexcept;
// Wake every thread blocked on `addr`
TILESTREAM_API void wakeAll(std::atomic_uint32_t *addr) noexcept;

} // namespace Futex

// Four-byte mutex satisfying Lockable, usable with `std::lock_guard`/`std::unique_lock`.
// Guards short critical sections like queue pushes and pops.
class TILESTREAM_API FutexLock {
public:
	FutexLock() = default;
	FutexLock(FutexLock &&) = delete;
	FutexLock(const FutexLock &) = delete;
	FutexLock &operator=(FutexLock &&) = delete;
	FutexLock &operator=(const FutexLock &) = delete;
	~FutexLock() = default;

	void lock() noexcept;
	bool try_lock() noexcept;
	void unlock() noexcept;

private:
	// 0 - free, 1 - locked, 2 - locked with possible waiters
	std::atomic_uint32_t m_payload = 0;
};

} // namespace tilestream::os
