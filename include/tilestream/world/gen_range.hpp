#pragma once

#include <tilestream/visibility.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tilestream::world
{

// Closed integer interval `[first; last]` mapped to a terrain class index
struct GenRange {
	int32_t first = 0;
	int32_t last = 0;
	uint8_t class_index = 0;

	bool operator==(const GenRange &) const = default;
};

// Flattened `GenRange` table giving O(1) integer -> class lookup over `[-max; max]`
class TILESTREAM_API GenRangeMap {
public:
	// Ranges are sorted by `first`, then validated:
	// - at least one range and at least one class;
	// - `first <= last` for every range;
	// - class indices are below `class_count`;
	// - `previous.last < next.first` (no overlaps);
	// - minimal `first` equals negated maximal `last`.
	// Throws `Exception` with `InvalidConfig` on violation.
	// Gaps between ranges are allowed but reported with a warning.
	GenRangeMap(std::vector<GenRange> ranges, size_t class_count);

	// The extremum, noise values are scaled by it before lookup
	int32_t max() const noexcept { return m_max; }
	const std::vector<GenRange> &ranges() const noexcept { return m_ranges; }
	bool hasGaps() const noexcept { return m_has_gaps; }

	// Throws `Exception` with `InvalidData` if `value` is outside `[-max; max]`
	// or falls into a gap between ranges
	uint8_t lookup(int32_t value) const;

private:
	constexpr static int16_t NO_CLASS = -1;

	std::vector<GenRange> m_ranges;
	// Index `i` holds the class of integer `i - max`
	std::vector<int16_t> m_flat;
	int32_t m_max = 0;
	bool m_has_gaps = false;
};

} // namespace tilestream::world
