#include <tilestream/util/futex_work_counter.hpp>

#include <tilestream/os/futex.hpp>

namespace tilestream
{

namespace
{

constexpr uint32_t STOP_BIT = 1u << 31u;

FutexWorkCounter::Value unpack(uint32_t raw) noexcept
{
	return { raw & (STOP_BIT - 1u), (raw & STOP_BIT) != 0 };
}

} // namespace

auto FutexWorkCounter::loadRelaxed() const noexcept -> Value
{
	return unpack(m_counter.load(std::memory_order_relaxed));
}

void FutexWorkCounter::addWork(uint32_t amount) noexcept
{
	if (m_counter.fetch_add(amount, std::memory_order_release) == 0) {
		os::Futex::wakeAll(&m_counter);
	}
}

auto FutexWorkCounter::removeWork(uint32_t amount) noexcept -> Value
{
	Value value = unpack(m_counter.fetch_sub(amount, std::memory_order_acq_rel));
	value.first -= amount;
	return value;
}

void FutexWorkCounter::requestStop() noexcept
{
	if (m_counter.fetch_or(STOP_BIT, std::memory_order_release) == 0) {
		os::Futex::wakeAll(&m_counter);
	}
}

auto FutexWorkCounter::wait() noexcept -> Value
{
	uint32_t raw = m_counter.load(std::memory_order_acquire);
	while (raw == 0) {
		os::Futex::waitInfinite(&m_counter, raw);
		raw = m_counter.load(std::memory_order_acquire);
	}
	return unpack(raw);
}

} // namespace tilestream
