#include <tilestream/world/coord_mapper.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tilestream::world
{

namespace
{

constexpr int64_t I32_MIN = std::numeric_limits<int32_t>::min();
constexpr int64_t I32_MAX = std::numeric_limits<int32_t>::max();

// NaN maps to zero
int32_t saturateToInt32(double value) noexcept
{
	if (std::isnan(value)) {
		return 0;
	}
	return int32_t(std::clamp(value, double(I32_MIN), double(I32_MAX)));
}

int32_t saturateToInt32(int64_t value) noexcept
{
	return int32_t(std::clamp(value, I32_MIN, I32_MAX));
}

bool isOriginInRange(int32_t coord, int32_t chunk_size) noexcept
{
	const int64_t origin = int64_t(coord) * int64_t(chunk_size);
	return origin >= I32_MIN && origin + chunk_size - 1 <= I32_MAX;
}

int32_t floorDiv(int32_t a, int32_t b) noexcept
{
	int32_t q = a / b;
	if ((a % b != 0) && ((a < 0) != (b < 0))) {
		q--;
	}
	return q;
}

int32_t floorMod(int32_t a, int32_t b) noexcept
{
	int32_t r = a % b;
	if (r != 0 && ((r < 0) != (b < 0))) {
		r += b;
	}
	return r;
}

} // namespace

ChunkCoord CoordMapper::worldToChunk(glm::dvec2 world_pos) const noexcept
{
	const double size = double(chunkPixelSize());
	return { saturateToInt32(std::floor(world_pos.x / size)), saturateToInt32(std::floor(world_pos.y / size)) };
}

glm::ivec2 CoordMapper::worldToTile(glm::dvec2 world_pos) const noexcept
{
	const double size = double(m_tile_size);
	return { saturateToInt32(std::floor(world_pos.x / size)), saturateToInt32(std::floor(world_pos.y / size)) };
}

glm::ivec2 CoordMapper::chunkOriginTile(ChunkCoord coord) const noexcept
{
	return {
		saturateToInt32(int64_t(coord.x) * int64_t(m_chunk_size)),
		saturateToInt32(int64_t(coord.y) * int64_t(m_chunk_size)),
	};
}

bool CoordMapper::isChunkInRange(ChunkCoord coord) const noexcept
{
	return isOriginInRange(coord.x, m_chunk_size) && isOriginInRange(coord.y, m_chunk_size);
}

ChunkCoord CoordMapper::tileToChunk(glm::ivec2 tile) const noexcept
{
	return { floorDiv(tile.x, m_chunk_size), floorDiv(tile.y, m_chunk_size) };
}

glm::ivec2 CoordMapper::tileToLocal(glm::ivec2 tile) const noexcept
{
	return { floorMod(tile.x, m_chunk_size), floorMod(tile.y, m_chunk_size) };
}

} // namespace tilestream::world
