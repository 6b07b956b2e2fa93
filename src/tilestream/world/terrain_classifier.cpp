#include <tilestream/world/terrain_classifier.hpp>

#include <tilestream/util/error_condition.hpp>
#include <tilestream/util/exception.hpp>
#include <tilestream/util/hash.hpp>
#include <tilestream/world/coord_mapper.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace tilestream::world
{

namespace
{

NoiseParams variantParams(NoiseParams params) noexcept
{
	params.seed = Hash::deriveSeed(params.seed, TerrainClassifier::VARIANT_SEED_SALT);
	return params;
}

} // namespace

TerrainClassifier::TerrainClassifier(const NoiseParams &noise, std::vector<GenRange> ranges,
	const TerrainClassTable &classes)
	: m_noise(noise), m_variant_noise(variantParams(noise)), m_ranges(std::move(ranges), classes.size())
{
	m_variant_counts.reserve(classes.size());
	for (const TerrainClassInfo &info : classes.classes()) {
		m_variant_counts.push_back(uint8_t(std::min<size_t>(info.colors.size(), 255)));
	}
}

TileInfo TerrainClassifier::classify(int32_t x, int32_t y) const
{
	const double value = m_noise.sample(double(x), double(y));
	const int32_t range_index = int32_t(std::lround(value * double(m_ranges.max())));

	TileInfo info;
	info.class_index = m_ranges.lookup(range_index);

	const int32_t count = m_variant_counts[info.class_index];
	const double variant_value = std::abs(m_variant_noise.sample(double(x), double(y)));
	info.variant = uint8_t(std::clamp(int32_t(std::floor(variant_value * count)), 0, count - 1));

	return info;
}

ChunkData TerrainClassifier::generateChunk(ChunkCoord coord, int32_t chunk_size) const
{
	const CoordMapper mapper(1, chunk_size);
	if (!mapper.isChunkInRange(coord)) {
		throw Exception::fromError(TileStreamErrc::InvalidData,
			fmt::format("chunk ({}, {}) is outside of tile coordinate range", coord.x, coord.y));
	}

	const glm::ivec2 origin = mapper.chunkOriginTile(coord);
	ChunkData data(coord, origin, chunk_size);

	for (int32_t ly = 0; ly < chunk_size; ly++) {
		for (int32_t lx = 0; lx < chunk_size; lx++) {
			data.tileAt(lx, ly) = classify(origin.x + lx, origin.y + ly);
		}
	}

	return data;
}

} // namespace tilestream::world
