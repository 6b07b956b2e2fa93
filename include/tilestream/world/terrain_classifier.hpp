#pragma once

#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_data.hpp>
#include <tilestream/world/fractal_noise.hpp>
#include <tilestream/world/gen_range.hpp>
#include <tilestream/world/terrain_class.hpp>

#include <cstdint>
#include <vector>

namespace tilestream::world
{

// Maps world tile coordinates to terrain classes.
// Samples fractal noise, scales it by the gen range extremum, rounds to
// the nearest integer and looks the class up in the gen range table.
// A second, independently seeded noise picks the color variant.
// Pure function of `(x, y)` and construction parameters, safe to call concurrently.
class TILESTREAM_API TerrainClassifier {
public:
	// Salt deriving the variant noise seed from the main one
	constexpr static uint64_t VARIANT_SEED_SALT = 0x76617269616e74;

	// Only variant counts are taken from `classes`, it need not outlive the classifier.
	// Throws `Exception` with `InvalidConfig` if gen ranges don't match the class table.
	TerrainClassifier(const NoiseParams &noise, std::vector<GenRange> ranges, const TerrainClassTable &classes);

	// Throws `Exception` with `InvalidData` when the sample falls into a gen range gap
	TileInfo classify(int32_t x, int32_t y) const;

	// Classify every tile of chunk `coord` sized `chunk_size` x `chunk_size`.
	// Throws like `classify`, no partially filled chunk is ever returned.
	ChunkData generateChunk(ChunkCoord coord, int32_t chunk_size) const;

	const NoiseParams &noiseParams() const noexcept { return m_noise.params(); }
	const GenRangeMap &genRanges() const noexcept { return m_ranges; }

private:
	FractalNoise2D m_noise;
	FractalNoise2D m_variant_noise;
	GenRangeMap m_ranges;
	std::vector<uint8_t> m_variant_counts;
};

} // namespace tilestream::world
