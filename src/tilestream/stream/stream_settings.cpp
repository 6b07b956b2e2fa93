#include <tilestream/stream/stream_settings.hpp>

#include <tilestream/util/error_condition.hpp>
#include <tilestream/util/exception.hpp>
#include <tilestream/util/log.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace tilestream::stream
{

namespace
{

constexpr std::string_view SECTION_STREAM = "stream";
constexpr std::string_view SECTION_NOISE = "noise";
constexpr std::string_view SECTION_TERRAIN = "terrain";

std::string_view trim(std::string_view s) noexcept
{
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
		s.remove_prefix(1);
	}
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
		s.remove_suffix(1);
	}
	return s;
}

template<typename T>
bool parseInt(std::string_view s, T &out) noexcept
{
	s = trim(s);
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
	return !s.empty() && ec == std::errc() && ptr == s.data() + s.size();
}

int32_t readInt32(const Config &config, std::string_view section, std::string_view name)
{
	int64_t value = config.getInt64(section, name);
	if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
		Log::error("Option {}/{} = {} does not fit int32", section, name, value);
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "config option out of range");
	}
	return int32_t(value);
}

void requireRange(std::string_view name, int64_t value, int64_t min, int64_t max)
{
	if (value < min || value > max) {
		Log::error("Setting '{}' = {} is outside of [{}; {}]", name, value, min, max);
		throw Exception::fromError(TileStreamErrc::InvalidConfig, fmt::format("invalid value of '{}'", name));
	}
}

} // namespace

void StreamSettings::validate() const
{
	constexpr int64_t I32_MAX = std::numeric_limits<int32_t>::max();

	requireRange("chunk_size", chunk_size, 1, 4096);
	requireRange("tile_size", tile_size, 1, I32_MAX);
	requireRange("buffer", buffer, 0, 1024);
	requireRange("max_concurrent", max_concurrent, 1, I32_MAX);
	requireRange("apply_per_tick", apply_per_tick, 1, I32_MAX);
	requireRange("max_retries", max_retries, 0, I32_MAX);
	requireRange("generation_timeout_ticks", generation_timeout_ticks, 0, I32_MAX);
	requireRange("worker_threads", worker_threads, 0, 1024);
	requireRange("octaves", noise.octaves, 1, 16);

	if (!(noise.frequency > 0.0) || !std::isfinite(noise.frequency)) {
		Log::error("Noise frequency {} must be positive and finite", noise.frequency);
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "invalid value of 'frequency'");
	}

	if (!(noise.lacunarity > 0.0 && noise.lacunarity <= world::NoiseParams::MAX_LACUNARITY)) {
		Log::error("Noise lacunarity {} is outside of (0; {}]", noise.lacunarity, world::NoiseParams::MAX_LACUNARITY);
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "invalid value of 'lacunarity'");
	}

	if (!(noise.gain >= 0.0 && noise.gain <= world::NoiseParams::MAX_GAIN)) {
		Log::error("Noise gain {} is outside of [0; {}]", noise.gain, world::NoiseParams::MAX_GAIN);
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "invalid value of 'gain'");
	}
}

bool StreamSettings::affectsGeneration(const StreamSettings &other) const noexcept
{
	return chunk_size != other.chunk_size || noise != other.noise || gen_ranges != other.gen_ranges;
}

std::shared_ptr<const world::IChunkGenerator> StreamSettings::makeGenerator(
	const world::TerrainClassTable &classes) const
{
	return std::make_shared<world::TerrainChunkGenerator>(world::TerrainClassifier(noise, gen_ranges, classes));
}

std::vector<world::GenRange> StreamSettings::defaultGenRanges()
{
	// Class indices follow `TerrainClassTable::makeDefault()`: 0 Water, 1 Grass, 2 Sand, 3 Rock
	return {
		{ .first = -4, .last = -1, .class_index = 0 },
		{ .first = 0, .last = 0, .class_index = 2 },
		{ .first = 1, .last = 2, .class_index = 1 },
		{ .first = 3, .last = 4, .class_index = 3 },
	};
}

cpp::result<std::vector<world::GenRange>, std::error_condition> StreamSettings::parseGenRanges(
	std::string_view text) noexcept
{
	std::vector<world::GenRange> ranges;
	auto fail = [] { return cpp::failure(make_error_condition(TileStreamErrc::InvalidConfig)); };

	try {
		while (!trim(text).empty()) {
			size_t end = text.find(';');
			std::string_view entry = trim(text.substr(0, end));
			text = end == std::string_view::npos ? std::string_view() : text.substr(end + 1);

			if (entry.empty()) {
				continue;
			}

			size_t dots = entry.find("..");
			size_t colon = entry.find(':', dots == std::string_view::npos ? 0 : dots + 2);
			if (dots == std::string_view::npos || colon == std::string_view::npos) {
				return fail();
			}

			world::GenRange range;
			unsigned class_index = 0;
			if (!parseInt(entry.substr(0, dots), range.first)
				|| !parseInt(entry.substr(dots + 2, colon - dots - 2), range.last)
				|| !parseInt(entry.substr(colon + 1), class_index) || class_index > 255) {
				return fail();
			}

			range.class_index = uint8_t(class_index);
			ranges.push_back(range);
		}
	}
	catch (const std::bad_alloc &) {
		return cpp::failure(std::make_error_condition(std::errc::not_enough_memory));
	}

	if (ranges.empty()) {
		return fail();
	}

	return ranges;
}

std::string StreamSettings::formatGenRanges(const std::vector<world::GenRange> &ranges)
{
	std::string text;
	for (const world::GenRange &range : ranges) {
		if (!text.empty()) {
			text += "; ";
		}
		text += fmt::format("{}..{}:{}", range.first, range.last, range.class_index);
	}
	return text;
}

Config::Scheme StreamSettings::configScheme()
{
	const StreamSettings d;
	Config::Scheme s;

	const std::string stream(SECTION_STREAM);
	const std::string noise(SECTION_NOISE);
	const std::string terrain(SECTION_TERRAIN);

	s.push_back({ stream, "chunk_size", "Tiles per chunk edge", int64_t(d.chunk_size) });
	s.push_back({ stream, "tile_size", "World pixels per tile edge", int64_t(d.tile_size) });
	s.push_back({ stream, "buffer", "Chunks generated around the visible area", int64_t(d.buffer) });
	s.push_back({ stream, "max_concurrent", "Maximal number of chunks generating at once", int64_t(d.max_concurrent) });
	s.push_back({ stream, "apply_per_tick", "Maximal number of chunks applied per tick", int64_t(d.apply_per_tick) });
	s.push_back({ stream, "max_retries", "Failures tolerated per chunk, 0 - unlimited", int64_t(d.max_retries) });
	s.push_back({ stream, "generation_timeout_ticks", "Ticks before a generating chunk is considered failed, 0 - never",
		int64_t(d.generation_timeout_ticks) });
	s.push_back({ stream, "worker_threads", "Generation worker threads, 0 - automatic", int64_t(d.worker_threads) });

	s.push_back({ noise, "seed", "Noise seed", int64_t(d.noise.seed) });
	s.push_back({ noise, "frequency", "Base noise frequency", d.noise.frequency });
	s.push_back({ noise, "octaves", "Number of noise octaves", int64_t(d.noise.octaves) });
	s.push_back({ noise, "lacunarity", "Frequency multiplier between octaves", d.noise.lacunarity });
	s.push_back({ noise, "gain", "Amplitude multiplier between octaves", d.noise.gain });

	s.push_back({ terrain, "gen_ranges", "Noise index ranges to terrain classes, 'first..last:class' separated by ';'",
		formatGenRanges(d.gen_ranges) });

	return s;
}

StreamSettings StreamSettings::fromConfig(const Config &config)
{
	StreamSettings s;

	s.chunk_size = readInt32(config, SECTION_STREAM, "chunk_size");
	s.tile_size = readInt32(config, SECTION_STREAM, "tile_size");
	s.buffer = readInt32(config, SECTION_STREAM, "buffer");
	s.max_concurrent = readInt32(config, SECTION_STREAM, "max_concurrent");
	s.apply_per_tick = readInt32(config, SECTION_STREAM, "apply_per_tick");
	s.max_retries = readInt32(config, SECTION_STREAM, "max_retries");
	s.generation_timeout_ticks = readInt32(config, SECTION_STREAM, "generation_timeout_ticks");
	s.worker_threads = readInt32(config, SECTION_STREAM, "worker_threads");

	s.noise.seed = uint64_t(config.getInt64(SECTION_NOISE, "seed"));
	s.noise.frequency = config.getDouble(SECTION_NOISE, "frequency");
	s.noise.octaves = readInt32(config, SECTION_NOISE, "octaves");
	s.noise.lacunarity = config.getDouble(SECTION_NOISE, "lacunarity");
	s.noise.gain = config.getDouble(SECTION_NOISE, "gain");

	std::string ranges_text = config.getString(SECTION_TERRAIN, "gen_ranges");
	auto ranges = parseGenRanges(ranges_text);
	if (!ranges) {
		Log::error("Can't parse gen ranges '{}'", ranges_text);
		throw Exception::fromError(ranges.error(), "malformed gen range table");
	}
	s.gen_ranges = std::move(ranges).value();

	s.validate();
	return s;
}

} // namespace tilestream::stream
