#pragma once

#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_data.hpp>
#include <tilestream/world/terrain_classifier.hpp>

#include <cstdint>

namespace tilestream::world
{

// Produces chunk data from a coordinate. Implementations must be
// safe to call concurrently from worker threads and must not touch
// any shared mutable state. Failures are reported by throwing.
class TILESTREAM_API IChunkGenerator {
public:
	virtual ~IChunkGenerator() = default;

	virtual ChunkData generate(ChunkCoord coord, int32_t chunk_size) const = 0;
};

class TILESTREAM_API TerrainChunkGenerator final : public IChunkGenerator {
public:
	explicit TerrainChunkGenerator(TerrainClassifier classifier) : m_classifier(std::move(classifier)) {}
	~TerrainChunkGenerator() override = default;

	ChunkData generate(ChunkCoord coord, int32_t chunk_size) const override
	{
		return m_classifier.generateChunk(coord, chunk_size);
	}

	const TerrainClassifier &classifier() const noexcept { return m_classifier; }

private:
	TerrainClassifier m_classifier;
};

} // namespace tilestream::world
