#pragma once

#include <tilestream/stream/stream_interfaces.hpp>
#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_coord.hpp>
#include <tilestream/world/coord_mapper.hpp>

#include <cstdint>
#include <functional>
#include <vector>

namespace tilestream::stream
{

// Inclusive rectangle of chunk coordinates
struct ChunkRect {
	world::ChunkCoord min;
	world::ChunkCoord max;

	int64_t width() const noexcept { return int64_t(max.x) - int64_t(min.x) + 1; }
	int64_t height() const noexcept { return int64_t(max.y) - int64_t(min.y) + 1; }
	int64_t area() const noexcept { return width() * height(); }

	bool contains(world::ChunkCoord c) const noexcept
	{
		return c.x >= min.x && c.x <= max.x && c.y >= min.y && c.y <= max.y;
	}

	bool operator==(const ChunkRect &) const = default;
};

namespace VisibilityPlanner
{

// Visible world rectangle is `center +- (size / zoom) / 2`, both corners are
// floored into chunk space and the result is expanded by `buffer` chunks on every side.
// Corners saturate at `int32_t` limits, check `ChunkRect::area()` before scanning.
TILESTREAM_API ChunkRect visibleChunkRect(const Viewport &viewport, const world::CoordMapper &mapper,
	int32_t buffer) noexcept;

// Every coordinate of `rect` accepted by `needs_work`, stably sorted
// by Manhattan distance to `center` (row-major order among equal distances)
TILESTREAM_API std::vector<world::ChunkCoord> admissionOrder(const ChunkRect &rect, world::ChunkCoord center,
	const std::function<bool(world::ChunkCoord)> &needs_work);

} // namespace VisibilityPlanner

} // namespace tilestream::stream
