#pragma once

#include <tilestream/os/futex.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace tilestream::stream
{

// Unbounded multi-producer single-consumer FIFO.
// Workers push from any thread, the scheduling thread pops without blocking.
template<typename T>
class CompletionChannel {
public:
	CompletionChannel() = default;
	CompletionChannel(CompletionChannel &&) = delete;
	CompletionChannel(const CompletionChannel &) = delete;
	CompletionChannel &operator=(CompletionChannel &&) = delete;
	CompletionChannel &operator=(const CompletionChannel &) = delete;
	~CompletionChannel() = default;

	void push(T &&item)
	{
		std::lock_guard lock(m_lock);
		m_items.push_back(std::move(item));
		m_size.store(m_items.size(), std::memory_order_release);
	}

	// Returns `std::nullopt` when empty, never blocks on producers
	std::optional<T> tryPop()
	{
		std::lock_guard lock(m_lock);
		if (m_items.empty()) {
			return std::nullopt;
		}

		std::optional<T> item(std::move(m_items.front()));
		m_items.pop_front();
		m_size.store(m_items.size(), std::memory_order_release);
		return item;
	}

	// Might be outdated by the time it returns
	size_t sizeApprox() const noexcept { return m_size.load(std::memory_order_acquire); }

private:
	mutable os::FutexLock m_lock;
	std::deque<T> m_items;
	std::atomic_size_t m_size = 0;
};

} // namespace tilestream::stream
