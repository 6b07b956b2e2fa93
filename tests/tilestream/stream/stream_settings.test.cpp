#include <tilestream/stream/stream_settings.hpp>

#include <tilestream/util/error_condition.hpp>
#include <tilestream/world/terrain_class.hpp>

#include "../../tilestream_test_common.hpp"

#include <limits>

namespace tilestream::stream
{

TEST_CASE("'StreamSettings' defaults are valid", "[tilestream::stream::stream_settings]")
{
	StreamSettings s;
	CHECK_NOTHROW(s.validate());

	CHECK(s.chunk_size == 600);
	CHECK(s.tile_size == 4);
	CHECK(s.buffer == 1);
	CHECK(s.max_concurrent == 4);
	CHECK(s.apply_per_tick == 2);
	CHECK(s.gen_ranges == StreamSettings::defaultGenRanges());

	// Default gen ranges must fit the default class table
	const auto classes = world::TerrainClassTable::makeDefault();
	auto generator = s.makeGenerator(classes);
	REQUIRE(generator != nullptr);

	world::ChunkData data = generator->generate({ 2, -3 }, 8);
	CHECK(data.coord() == (world::ChunkCoord { 2, -3 }));
	CHECK(data.startTile() == glm::ivec2(16, -24));
	CHECK(data.width() == 8);
	CHECK(data.height() == 8);
}

TEST_CASE("'StreamSettings' rejects invalid values", "[tilestream::stream::stream_settings]")
{
	auto invalid = test::errcExceptionMatcher(TileStreamErrc::InvalidConfig);
	StreamSettings s;

	SECTION("chunk_size")
	{
		s.chunk_size = 0;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.chunk_size = 4097;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
	}

	SECTION("scheduling limits")
	{
		s.max_concurrent = 0;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.max_concurrent = 1;
		s.apply_per_tick = 0;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.apply_per_tick = 1;
		s.buffer = -1;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.buffer = 0;
		s.max_retries = -1;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
	}

	SECTION("noise")
	{
		s.noise.octaves = 0;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.octaves = 17;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.octaves = 3;
		s.noise.frequency = 0.0;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.frequency = std::numeric_limits<double>::infinity();
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.frequency = 0.01;

		// Large finite multipliers would overflow octave frequency or amplitude
		s.noise.lacunarity = 0.0;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.lacunarity = 1.0e200;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.lacunarity = std::numeric_limits<double>::quiet_NaN();
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.lacunarity = world::NoiseParams::MAX_LACUNARITY;
		CHECK_NOTHROW(s.validate());

		s.noise.gain = -0.5;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.gain = 1.0e100;
		CHECK_THROWS_MATCHES(s.validate(), Exception, invalid);
		s.noise.gain = world::NoiseParams::MAX_GAIN;
		CHECK_NOTHROW(s.validate());
		s.noise.gain = 0.0;
		CHECK_NOTHROW(s.validate());
	}

	SECTION("gen ranges not fitting the class table")
	{
		s.gen_ranges = { { .first = -1, .last = 1, .class_index = 7 } };
		CHECK_NOTHROW(s.validate());

		const auto classes = world::TerrainClassTable::makeDefault();
		CHECK_THROWS_MATCHES(s.makeGenerator(classes), Exception, invalid);
	}
}

TEST_CASE("'StreamSettings' detects generation-affecting changes", "[tilestream::stream::stream_settings]")
{
	const StreamSettings base;
	StreamSettings other = base;
	CHECK_FALSE(base.affectsGeneration(other));

	other.max_concurrent = 16;
	other.apply_per_tick = 8;
	other.buffer = 3;
	other.tile_size = 8;
	other.max_retries = 5;
	CHECK_FALSE(base.affectsGeneration(other));

	other = base;
	other.chunk_size = 64;
	CHECK(base.affectsGeneration(other));

	other = base;
	other.noise.seed = 42;
	CHECK(base.affectsGeneration(other));

	other = base;
	other.noise.octaves = 5;
	CHECK(base.affectsGeneration(other));

	other = base;
	other.gen_ranges[0].class_index = 1;
	CHECK(base.affectsGeneration(other));
}

TEST_CASE("'StreamSettings' parses gen range tables", "[tilestream::stream::stream_settings]")
{
	auto ranges = StreamSettings::parseGenRanges("-4..-1:0; 0..0:2; 1..2:1; 3..4:3");
	REQUIRE(ranges.has_value());
	CHECK(*ranges == StreamSettings::defaultGenRanges());

	ranges = StreamSettings::parseGenRanges("  -2..2 : 1 ;; ");
	REQUIRE(ranges.has_value());
	REQUIRE(ranges->size() == 1);
	CHECK((*ranges)[0] == (world::GenRange { .first = -2, .last = 2, .class_index = 1 }));

	CHECK(StreamSettings::formatGenRanges(StreamSettings::defaultGenRanges()) == "-4..-1:0; 0..0:2; 1..2:1; 3..4:3");

	for (const char *bad : { "", " ; ", "1..2", "1:2", "a..2:0", "1..b:0", "1..2:x", "1..2:256", "1..2:-1",
			 "1..2:0;3..4" }) {
		INFO("Input: '" << bad << "'");
		auto result = StreamSettings::parseGenRanges(bad);
		REQUIRE(result.has_error());
		CHECK(result.error() == TileStreamErrc::InvalidConfig);
	}
}

TEST_CASE("'StreamSettings' reads config", "[tilestream::stream::stream_settings]")
{
	Config config(StreamSettings::configScheme());

	SECTION("Defaults")
	{
		StreamSettings s = StreamSettings::fromConfig(config);
		CHECK_FALSE(s.affectsGeneration(StreamSettings()));
		CHECK(s.max_concurrent == 4);
		CHECK(s.apply_per_tick == 2);
		CHECK(s.buffer == 1);
	}

	SECTION("Patched values")
	{
		config.patch("stream", "chunk_size", "32");
		config.patch("stream", "max_concurrent", "8");
		config.patch("stream", "generation_timeout_ticks", "30");
		config.patch("noise", "seed", "12345");
		config.patch("noise", "frequency", "0.05");
		config.patch("terrain", "gen_ranges", "-1..-1:0; 0..1:1");

		StreamSettings s = StreamSettings::fromConfig(config);
		CHECK(s.chunk_size == 32);
		CHECK(s.max_concurrent == 8);
		CHECK(s.generation_timeout_ticks == 30);
		CHECK(s.noise.seed == 12345u);
		CHECK(s.noise.frequency == Approx(0.05));
		REQUIRE(s.gen_ranges.size() == 2);
		CHECK(s.gen_ranges[1] == (world::GenRange { .first = 0, .last = 1, .class_index = 1 }));
	}

	SECTION("Invalid values")
	{
		auto invalid = test::errcExceptionMatcher(TileStreamErrc::InvalidConfig);

		config.patch("stream", "apply_per_tick", "0");
		CHECK_THROWS_MATCHES(StreamSettings::fromConfig(config), Exception, invalid);

		config.patch("stream", "apply_per_tick", "2");
		config.patch("stream", "buffer", "10000000000");
		CHECK_THROWS_MATCHES(StreamSettings::fromConfig(config), Exception, invalid);

		config.patch("stream", "buffer", "1");
		config.patch("terrain", "gen_ranges", "garbage");
		CHECK_THROWS_MATCHES(StreamSettings::fromConfig(config), Exception, invalid);
	}
}

} // namespace tilestream::stream
