#pragma once

#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_coord.hpp>

#include <glm/vec2.hpp>

#include <cstdint>

namespace tilestream::world
{

// Conversions between world pixels, tiles and chunks.
// World pixels are continuous (`glm::dvec2`), tiles and chunks are integer lattices.
// All conversions floor so that negative positions map below/left of the origin.
// Results outside of `int32_t` range saturate to its limits.
class TILESTREAM_API CoordMapper {
public:
	// Both sizes must be positive, `StreamSettings` validates them
	CoordMapper(int32_t tile_size, int32_t chunk_size) noexcept : m_tile_size(tile_size), m_chunk_size(chunk_size) {}

	int32_t tileSize() const noexcept { return m_tile_size; }
	int32_t chunkSize() const noexcept { return m_chunk_size; }
	// Chunk side length in world pixels
	int64_t chunkPixelSize() const noexcept { return int64_t(m_tile_size) * int64_t(m_chunk_size); }

	ChunkCoord worldToChunk(glm::dvec2 world_pos) const noexcept;
	glm::ivec2 worldToTile(glm::dvec2 world_pos) const noexcept;

	// Tile coordinate of the chunk's top-left tile, meaningful only if `isChunkInRange(coord)`
	glm::ivec2 chunkOriginTile(ChunkCoord coord) const noexcept;
	// True if every tile of the chunk has a coordinate representable as `int32_t`
	bool isChunkInRange(ChunkCoord coord) const noexcept;
	ChunkCoord tileToChunk(glm::ivec2 tile) const noexcept;
	// Tile position within its chunk, each component in `[0; chunkSize)`
	glm::ivec2 tileToLocal(glm::ivec2 tile) const noexcept;

private:
	int32_t m_tile_size;
	int32_t m_chunk_size;
};

} // namespace tilestream::world
