#include <tilestream/world/chunk_data.hpp>

namespace tilestream::world
{

ChunkData::ChunkData(ChunkCoord coord, glm::ivec2 start_tile, int32_t size)
	: m_coord(coord), m_start_tile(start_tile), m_width(size), m_height(size), m_tiles(size_t(size) * size_t(size))
{}

} // namespace tilestream::world
