#include <tilestream/stream/tile_world.hpp>

#include <tilestream/util/error_condition.hpp>
#include <tilestream/util/hash.hpp>
#include <tilestream/util/log.hpp>

#include <algorithm>

namespace tilestream::stream
{

namespace
{

uint64_t tileKey(glm::ivec2 tile) noexcept
{
	return Hash::packLattice(tile.x, tile.y);
}

} // namespace

TileWorld::TileWorld(const world::TerrainClassTable &classes, world::CoordMapper mapper)
	: m_classes(classes), m_mapper(mapper)
{}

TileWorld::~TileWorld() = default;

void TileWorld::presentChunk(world::ChunkData &&data)
{
	const world::ChunkCoord coord = data.coord();
	const glm::ivec2 origin = data.startTile();

	if (data.width() != m_mapper.chunkSize() || data.height() != m_mapper.chunkSize()) {
		Log::warn("Chunk ({}, {}) is {}x{} tiles, expected {}", coord.x, coord.y, data.width(), data.height(),
			m_mapper.chunkSize());
	}

	for (int32_t ly = 0; ly < data.height(); ly++) {
		for (int32_t lx = 0; lx < data.width(); lx++) {
			updateCollision(origin + glm::ivec2(lx, ly), data.tileAt(lx, ly).class_index);
		}
	}

	m_chunks.insert_or_assign(coord, std::move(data));
	Log::trace("Chunk ({}, {}) added to tile world, {} chunks total", coord.x, coord.y, m_chunks.size());
}

const world::ChunkData *TileWorld::chunk(world::ChunkCoord coord) const noexcept
{
	auto iter = m_chunks.find(coord);
	return iter != m_chunks.end() ? &iter->second : nullptr;
}

std::optional<world::TileInfo> TileWorld::tileAt(glm::ivec2 tile) const noexcept
{
	const world::ChunkData *data = chunk(m_mapper.tileToChunk(tile));
	if (!data) {
		return std::nullopt;
	}

	const glm::ivec2 local = m_mapper.tileToLocal(tile);
	if (local.x >= data->width() || local.y >= data->height()) {
		return std::nullopt;
	}

	return data->tileAt(local.x, local.y);
}

std::optional<world::TileInfo> TileWorld::terrainAt(glm::dvec2 world_pos) const noexcept
{
	return tileAt(m_mapper.worldToTile(world_pos));
}

bool TileWorld::hasCollision(glm::ivec2 tile) const noexcept
{
	return m_collision.contains(tileKey(tile));
}

bool TileWorld::modifyTile(glm::ivec2 tile, uint8_t class_index, uint8_t variant)
{
	if (class_index >= m_classes.size() || variant >= m_classes[class_index].colors.size()) {
		Log::warn("Can't set tile ({}, {}) to class {} variant {}: out of range", tile.x, tile.y, class_index,
			variant);
		return false;
	}

	auto iter = m_chunks.find(m_mapper.tileToChunk(tile));
	if (iter == m_chunks.end()) {
		return false;
	}

	world::ChunkData &data = iter->second;
	const glm::ivec2 local = m_mapper.tileToLocal(tile);
	if (local.x >= data.width() || local.y >= data.height()) {
		return false;
	}

	data.tileAt(local.x, local.y) = world::TileInfo { .class_index = class_index, .variant = variant };
	updateCollision(tile, class_index);
	return true;
}

void TileWorld::clear() noexcept
{
	m_chunks.clear();
	m_collision.clear();
}

cpp::result<ChunkRaster, std::error_condition> TileWorld::rasterizeChunk(world::ChunkCoord coord) const
{
	const world::ChunkData *data = chunk(coord);
	if (!data) {
		return cpp::failure(make_error_condition(TileStreamErrc::InvalidData));
	}

	const int32_t px = m_mapper.tileSize();

	ChunkRaster raster;
	raster.width = data->width() * px;
	raster.height = data->height() * px;
	raster.pixels.resize(size_t(raster.width) * size_t(raster.height));

	for (int32_t ly = 0; ly < data->height(); ly++) {
		for (int32_t lx = 0; lx < data->width(); lx++) {
			const world::TileInfo &info = data->tileAt(lx, ly);
			const PackedColorSrgb color = m_classes.colorOf(info.class_index, info.variant);

			for (int32_t y = ly * px; y < (ly + 1) * px; y++) {
				PackedColorSrgb *row = raster.pixels.data() + size_t(y) * size_t(raster.width);
				std::fill(row + lx * px, row + (lx + 1) * px, color);
			}
		}
	}

	return raster;
}

void TileWorld::updateCollision(glm::ivec2 tile, uint8_t class_index)
{
	if (m_classes.hasCollision(class_index)) {
		m_collision.insert(tileKey(tile));
	} else {
		m_collision.erase(tileKey(tile));
	}
}

} // namespace tilestream::stream
