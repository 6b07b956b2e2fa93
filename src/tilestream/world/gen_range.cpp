#include <tilestream/world/gen_range.hpp>

#include <tilestream/util/error_condition.hpp>
#include <tilestream/util/exception.hpp>
#include <tilestream/util/log.hpp>

#include <algorithm>

namespace tilestream::world
{

namespace
{

// Keeps the flattened table reasonably sized
constexpr int32_t MAX_RANGE_EXTREMUM = 1 << 20;

[[noreturn]] void failValidation(std::string_view what, extras::source_location loc = extras::source_location::current())
{
	Log::log(Log::Level::Error, loc, "Invalid gen range table: {}", what);
	throw Exception::fromError(TileStreamErrc::InvalidConfig, what, loc);
}

} // namespace

GenRangeMap::GenRangeMap(std::vector<GenRange> ranges, size_t class_count) : m_ranges(std::move(ranges))
{
	if (m_ranges.empty()) {
		failValidation("no ranges defined");
	}

	if (class_count == 0) {
		failValidation("no terrain classes defined");
	}

	std::stable_sort(m_ranges.begin(), m_ranges.end(),
		[](const GenRange &a, const GenRange &b) { return a.first < b.first; });

	for (size_t i = 0; i < m_ranges.size(); i++) {
		const GenRange &range = m_ranges[i];

		if (range.first > range.last) {
			Log::error("Range [{}; {}] has first > last", range.first, range.last);
			failValidation("range first must not exceed last");
		}

		if (range.class_index >= class_count) {
			Log::error("Range [{}; {}] maps to class {}, only {} classes exist", range.first, range.last,
				range.class_index, class_count);
			failValidation("class index out of bounds");
		}

		if (i > 0) {
			const GenRange &prev = m_ranges[i - 1];
			if (prev.last >= range.first) {
				Log::error("Ranges [{}; {}] and [{}; {}] overlap", prev.first, prev.last, range.first, range.last);
				failValidation("ranges must not overlap");
			}

			if (int64_t(prev.last) + 1 != int64_t(range.first)) {
				Log::warn("Gap ({}; {}) between gen ranges, noise values there will fail classification", prev.last,
					range.first);
				m_has_gaps = true;
			}
		}
	}

	const int32_t min_first = m_ranges.front().first;
	const int32_t max_last = m_ranges.back().last;

	if (int64_t(min_first) != -int64_t(max_last)) {
		Log::error("Range union [{}; {}] is not symmetric around zero", min_first, max_last);
		failValidation("range union must be symmetric around zero");
	}

	if (max_last > MAX_RANGE_EXTREMUM) {
		failValidation("range extremum is too large");
	}

	m_max = max_last;
	m_flat.assign(size_t(2 * m_max + 1), NO_CLASS);

	for (const GenRange &range : m_ranges) {
		for (int32_t v = range.first; v <= range.last; v++) {
			m_flat[size_t(v + m_max)] = range.class_index;
		}
	}
}

uint8_t GenRangeMap::lookup(int32_t value) const
{
	if (value < -m_max || value > m_max) {
		throw Exception::fromError(TileStreamErrc::InvalidData, "range index outside of gen range table");
	}

	int16_t cls = m_flat[size_t(value + m_max)];
	if (cls == NO_CLASS) {
		throw Exception::fromError(TileStreamErrc::InvalidData, "range index falls into a gap");
	}

	return uint8_t(cls);
}

} // namespace tilestream::world
