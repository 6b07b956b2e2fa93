#include <tilestream/os/futex.hpp>

#include <tilestream/util/log.hpp>

#include <linux/futex.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <climits>

#if defined(__x86_64__) || defined(__i386__)
	#include <emmintrin.h>
#endif

namespace tilestream::os
{

namespace
{

inline void cpuRelax() noexcept
{
#if defined(__x86_64__) || defined(__i386__)
	_mm_pause();
#elif defined(__aarch64__)
	asm volatile("yield" ::: "memory");
#endif
}

long futexCall(std::atomic_uint32_t *addr, int op, uint32_t value) noexcept
{
	return syscall(SYS_futex, addr, op, value, nullptr, nullptr, 0);
}

} // namespace

void Futex::waitInfinite(std::atomic_uint32_t *addr, uint32_t value) noexcept
{
	if (futexCall(addr, FUTEX_WAIT_PRIVATE, value) == -1) {
		int err = errno;
		// EAGAIN - value already changed, EINTR - signal; both end up in caller's re-check loop
		if (err != EAGAIN && err != EINTR) [[unlikely]] {
			Log::error("FUTEX_WAIT failed with errno {}", err);
		}
	}
}

void Futex::wakeSingle(std::atomic_uint32_t *addr) noexcept
{
	if (futexCall(addr, FUTEX_WAKE_PRIVATE, 1) == -1) [[unlikely]] {
		Log::error("FUTEX_WAKE(1) failed with errno {}", errno);
	}
}

void Futex::wakeAll(std::atomic_uint32_t *addr) noexcept
{
	if (futexCall(addr, FUTEX_WAKE_PRIVATE, INT_MAX) == -1) [[unlikely]] {
		Log::error("FUTEX_WAKE(all) failed with errno {}", errno);
	}
}

void FutexLock::lock() noexcept
{
	constexpr uint32_t MAX_SPIN_ROUNDS = 4;

	uint32_t expected = 0;

	for (uint32_t round = 0; round < MAX_SPIN_ROUNDS; round++) {
		expected = 0;
		if (m_payload.compare_exchange_weak(expected, 1, std::memory_order_acquire, std::memory_order_relaxed))
			[[likely]] {
			return;
		}

		if (expected == 2) {
			// Already contended, spinning won't help
			break;
		}

		for (uint32_t i = 0; i < (1u << round); i++) {
			cpuRelax();
		}
	}

	do {
		// Mark the lock as contended (unless it already is) and sleep on it
		if (expected == 2 || m_payload.compare_exchange_weak(expected, 2, std::memory_order_relaxed)) {
			Futex::waitInfinite(&m_payload, 2);
		}

		expected = 0;
		// Other waiters might exist, so acquire in the contended state
	} while (!m_payload.compare_exchange_weak(expected, 2, std::memory_order_acquire, std::memory_order_relaxed));
}

bool FutexLock::try_lock() noexcept
{
	uint32_t expected = 0;
	return m_payload.compare_exchange_strong(expected, 1, std::memory_order_acquire, std::memory_order_relaxed);
}

void FutexLock::unlock() noexcept
{
	if (m_payload.exchange(0, std::memory_order_release) == 2) {
		Futex::wakeSingle(&m_payload);
	}
}

} // namespace tilestream::os
