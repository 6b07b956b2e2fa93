#pragma once

#include <tilestream/common/config.hpp>
#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_generator.hpp>
#include <tilestream/world/fractal_noise.hpp>
#include <tilestream/world/gen_range.hpp>

#include <cpp/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tilestream::stream
{

struct TILESTREAM_API StreamSettings {
	// Tiles per chunk edge
	int32_t chunk_size = 600;
	// World pixels per tile edge
	int32_t tile_size = 4;
	// Extra chunks generated around the visible rectangle on every side
	int32_t buffer = 1;
	// At most this many chunks are generating at once
	int32_t max_concurrent = 4;
	// At most this many completed chunks are applied per tick
	int32_t apply_per_tick = 2;
	// Failures tolerated per coordinate before it's abandoned, 0 - retry forever
	int32_t max_retries = 0;
	// Ticks a chunk may stay generating before it's treated as failed, 0 - no timeout
	int32_t generation_timeout_ticks = 0;
	// Worker threads, 0 - pick automatically
	int32_t worker_threads = 0;

	world::NoiseParams noise;
	std::vector<world::GenRange> gen_ranges = defaultGenRanges();

	// Throws `Exception` with `InvalidConfig` describing the first violation.
	// Gen range invariants are checked separately by `GenRangeMap`.
	void validate() const;

	// True when generated contents depend on the difference,
	// i.e. switching between `*this` and `other` needs invalidation
	bool affectsGeneration(const StreamSettings &other) const noexcept;

	// Classifier-backed generator for these noise parameters and gen ranges.
	// Throws `Exception` with `InvalidConfig` if gen ranges don't fit `classes`.
	std::shared_ptr<const world::IChunkGenerator> makeGenerator(const world::TerrainClassTable &classes) const;

	// Water/Sand/Grass/Rock layout over `[-4; 4]`
	static std::vector<world::GenRange> defaultGenRanges();

	// "first..last:class" entries separated by ';', e.g. "-4..-1:0; 0..0:2; 1..2:1; 3..4:3"
	static cpp::result<std::vector<world::GenRange>, std::error_condition> parseGenRanges(
		std::string_view text) noexcept;
	static std::string formatGenRanges(const std::vector<world::GenRange> &ranges);

	// Every option `fromConfig` reads, with defaults matching a default-constructed object
	static Config::Scheme configScheme();
	// Read and validate settings. Throws `Exception` with `OptionMissing`
	// for absent options and `InvalidConfig` for invalid values.
	static StreamSettings fromConfig(const Config &config);
};

} // namespace tilestream::stream
