#pragma once

#include <tilestream/stream/stream_interfaces.hpp>
#include <tilestream/util/packed_color.hpp>
#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_data.hpp>
#include <tilestream/world/coord_mapper.hpp>
#include <tilestream/world/terrain_class.hpp>

#include <cpp/result.hpp>

#include <glm/vec2.hpp>

#include <cstdint>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tilestream::stream
{

// sRGB image of one chunk, `tile_size` pixels per tile edge, row-major
struct ChunkRaster {
	int32_t width = 0;
	int32_t height = 0;
	std::vector<PackedColorSrgb> pixels;

	PackedColorSrgb pixelAt(int32_t x, int32_t y) const noexcept { return pixels[size_t(y) * size_t(width) + size_t(x)]; }
};

// In-memory world made of presented chunks.
// Tracks collision tiles for classes flagged as colliding and supports tile edits.
class TILESTREAM_API TileWorld final : public IChunkRenderer {
public:
	// `classes` must outlive the world
	TileWorld(const world::TerrainClassTable &classes, world::CoordMapper mapper);
	TileWorld(TileWorld &&) = delete;
	TileWorld(const TileWorld &) = delete;
	TileWorld &operator=(TileWorld &&) = delete;
	TileWorld &operator=(const TileWorld &) = delete;
	~TileWorld() override;

	// Replaces the chunk if it was already presented
	void presentChunk(world::ChunkData &&data) override;

	size_t chunkCount() const noexcept { return m_chunks.size(); }
	bool hasChunk(world::ChunkCoord coord) const noexcept { return m_chunks.contains(coord); }
	const std::unordered_map<world::ChunkCoord, world::ChunkData> &chunks() const noexcept { return m_chunks; }
	// Null if the chunk is not loaded
	const world::ChunkData *chunk(world::ChunkCoord coord) const noexcept;

	std::optional<world::TileInfo> tileAt(glm::ivec2 tile) const noexcept;
	// Tile under a world pixel position, empty if its chunk is not loaded
	std::optional<world::TileInfo> terrainAt(glm::dvec2 world_pos) const noexcept;

	bool hasCollision(glm::ivec2 tile) const noexcept;
	size_t collisionTileCount() const noexcept { return m_collision.size(); }

	// Change one tile, updating collision. Returns false (and changes nothing)
	// if its chunk is not loaded or `class_index`/`variant` are out of range.
	bool modifyTile(glm::ivec2 tile, uint8_t class_index, uint8_t variant);

	// Drop every chunk and collision tile
	void clear() noexcept;

	// Fails with `TileStreamErrc::InvalidData` if the chunk is not loaded
	cpp::result<ChunkRaster, std::error_condition> rasterizeChunk(world::ChunkCoord coord) const;

	const world::CoordMapper &coordMapper() const noexcept { return m_mapper; }

private:
	void updateCollision(glm::ivec2 tile, uint8_t class_index);

	const world::TerrainClassTable &m_classes;
	world::CoordMapper m_mapper;
	std::unordered_map<world::ChunkCoord, world::ChunkData> m_chunks;
	// Packed tile coordinates
	std::unordered_set<uint64_t> m_collision;
};

} // namespace tilestream::stream
