#include <tilestream/stream/visibility_planner.hpp>

#include <algorithm>
#include <limits>

namespace tilestream::stream
{

namespace
{

int32_t expandSaturated(int32_t value, int64_t delta) noexcept
{
	return int32_t(std::clamp<int64_t>(int64_t(value) + delta, std::numeric_limits<int32_t>::min(),
		std::numeric_limits<int32_t>::max()));
}

} // namespace

ChunkRect VisibilityPlanner::visibleChunkRect(const Viewport &viewport, const world::CoordMapper &mapper,
	int32_t buffer) noexcept
{
	const glm::dvec2 half_extent = (viewport.size / viewport.zoom) * 0.5;

	world::ChunkCoord min = mapper.worldToChunk(viewport.center - half_extent);
	world::ChunkCoord max = mapper.worldToChunk(viewport.center + half_extent);

	return ChunkRect {
		.min = { expandSaturated(min.x, -int64_t(buffer)), expandSaturated(min.y, -int64_t(buffer)) },
		.max = { expandSaturated(max.x, buffer), expandSaturated(max.y, buffer) },
	};
}

std::vector<world::ChunkCoord> VisibilityPlanner::admissionOrder(const ChunkRect &rect, world::ChunkCoord center,
	const std::function<bool(world::ChunkCoord)> &needs_work)
{
	std::vector<world::ChunkCoord> result;

	// 64-bit counters, the rectangle may touch `INT32_MAX`
	for (int64_t y = rect.min.y; y <= rect.max.y; y++) {
		for (int64_t x = rect.min.x; x <= rect.max.x; x++) {
			world::ChunkCoord coord { int32_t(x), int32_t(y) };
			if (needs_work(coord)) {
				result.push_back(coord);
			}
		}
	}

	std::stable_sort(result.begin(), result.end(), [center](world::ChunkCoord a, world::ChunkCoord b) {
		return world::manhattanDistance(a, center) < world::manhattanDistance(b, center);
	});

	return result;
}

} // namespace tilestream::stream
