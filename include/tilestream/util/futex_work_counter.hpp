#pragma once

#include <tilestream/visibility.hpp>

#include <atomic>
#include <cstdint>
#include <utility>

namespace tilestream
{

// Lets a worker thread sleep until work arrives or shutdown is requested.
// Packs the pending item count and a stop flag into a single futex word.
class TILESTREAM_API FutexWorkCounter final {
public:
	// <pending work items; stop requested>
	using Value = std::pair<uint32_t, bool>;

	FutexWorkCounter() = default;
	FutexWorkCounter(FutexWorkCounter &&) = delete;
	FutexWorkCounter(const FutexWorkCounter &) = delete;
	FutexWorkCounter &operator=(FutexWorkCounter &&) = delete;
	FutexWorkCounter &operator=(const FutexWorkCounter &) = delete;
	~FutexWorkCounter() = default;

	// Relaxed snapshot. Good enough to pick the least loaded worker, not for synchronization.
	Value loadRelaxed() const noexcept;

	// Add pending items, waking waiters if the counter was idle
	void addWork(uint32_t amount) noexcept;
	// Acknowledge consumed items. Returns the value after the decrement.
	Value removeWork(uint32_t amount) noexcept;
	// Set the stop flag and wake waiters
	void requestStop() noexcept;

	// Block until there is pending work or the stop flag is set
	Value wait() noexcept;

private:
	std::atomic_uint32_t m_counter = 0;
};

} // namespace tilestream
