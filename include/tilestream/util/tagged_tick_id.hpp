#pragma once

#include <compare>
#include <cstdint>

namespace tilestream
{

// Tick counter bound to one timeline (selected by `Tag`).
// Values from different timelines can't be compared or subtracted.
template<typename Tag>
struct TaggedTickId {
	constexpr TaggedTickId() = default;
	// Explicit - untagged integers must not turn into ticks silently
	constexpr explicit TaggedTickId(int64_t val) noexcept : value(val) {}

	constexpr auto operator<=>(const TaggedTickId &other) const = default;

	// Number of ticks elapsed between two points, not a tick itself
	constexpr int64_t operator-(TaggedTickId d) const noexcept { return value - d.value; }

	constexpr TaggedTickId &operator++() noexcept
	{
		++value;
		return *this;
	}

	int64_t value = 0;
};

struct StreamTickTag {};
// Scheduling timeline of `ChunkStreamer`, advanced by every `tick()` call
using StreamTickId = TaggedTickId<StreamTickTag>;

} // namespace tilestream
