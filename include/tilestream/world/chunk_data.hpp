#pragma once

#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_coord.hpp>

#include <glm/vec2.hpp>

#include <cstdint>
#include <vector>

namespace tilestream::world
{

struct TileInfo {
	// Index into `TerrainClassTable`
	uint8_t class_index = 0;
	// Index into the class color variants
	uint8_t variant = 0;

	bool operator==(const TileInfo &) const = default;
};

// Classified tiles of one chunk, row-major.
// Move-only in practice: it travels from a worker task through
// the completion channel into the renderer without copies.
class TILESTREAM_API ChunkData {
public:
	ChunkData() = default;
	ChunkData(ChunkCoord coord, glm::ivec2 start_tile, int32_t size);
	ChunkData(ChunkData &&) = default;
	ChunkData(const ChunkData &) = default;
	ChunkData &operator=(ChunkData &&) = default;
	ChunkData &operator=(const ChunkData &) = default;
	~ChunkData() = default;

	ChunkCoord coord() const noexcept { return m_coord; }
	glm::ivec2 startTile() const noexcept { return m_start_tile; }
	int32_t width() const noexcept { return m_width; }
	int32_t height() const noexcept { return m_height; }

	// Local coordinates, no bounds checking
	TileInfo &tileAt(int32_t lx, int32_t ly) noexcept { return m_tiles[size_t(ly) * size_t(m_width) + size_t(lx)]; }
	const TileInfo &tileAt(int32_t lx, int32_t ly) const noexcept
	{
		return m_tiles[size_t(ly) * size_t(m_width) + size_t(lx)];
	}

	const std::vector<TileInfo> &tiles() const noexcept { return m_tiles; }

private:
	ChunkCoord m_coord;
	glm::ivec2 m_start_tile { 0, 0 };
	int32_t m_width = 0;
	int32_t m_height = 0;
	std::vector<TileInfo> m_tiles;
};

} // namespace tilestream::world
