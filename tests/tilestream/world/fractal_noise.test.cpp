#include <tilestream/world/fractal_noise.hpp>

#include "../../test_common.hpp"

#include <cmath>
#include <limits>

namespace tilestream::world
{

TEST_CASE("'FractalNoise2D' stays within [-1; 1]", "[tilestream::world::fractal_noise]")
{
	for (int32_t octaves : { 1, 3, 8 }) {
		FractalNoise2D noise(NoiseParams { .seed = 1234, .frequency = 0.37, .octaves = octaves });

		double min = 1.0;
		double max = -1.0;

		for (int32_t y = -60; y < 60; y++) {
			for (int32_t x = -60; x < 60; x++) {
				double v = noise.sample(double(x) + 0.25, double(y) - 0.5);
				min = std::min(min, v);
				max = std::max(max, v);
			}
		}

		INFO("Octaves: " << octaves);
		CHECK(min >= -1.0);
		CHECK(max <= 1.0);
		// Should actually vary, not be stuck at a constant
		CHECK(max - min > 0.2);
	}
}

TEST_CASE("'FractalNoise2D' is deterministic per seed", "[tilestream::world::fractal_noise]")
{
	NoiseParams params { .seed = 42, .frequency = 0.05, .octaves = 4, .lacunarity = 2.0, .gain = 0.5 };

	FractalNoise2D a(params);
	FractalNoise2D b(params);

	params.seed = 43;
	FractalNoise2D c(params);

	int differing = 0;
	for (int32_t i = -50; i < 50; i++) {
		double x = double(i) * 3.7;
		double y = double(i) * -1.3;
		CHECK(a.sample(x, y) == b.sample(x, y));
		differing += a.sample(x, y) != c.sample(x, y) ? 1 : 0;
	}

	CHECK(differing > 50);
}

TEST_CASE("'FractalNoise2D' single octave vanishes at lattice points", "[tilestream::world::fractal_noise]")
{
	// Only the origin corner is in reach there, and its offset is zero
	CHECK(FractalNoise2D::sampleSimplex(7, 0.0, 0.0) == 0.0);
	CHECK(std::abs(FractalNoise2D::sampleSimplex(7, 0.3, 0.6)) <= 1.0);
}

TEST_CASE("'FractalNoise2D' clamps octave count", "[tilestream::world::fractal_noise]")
{
	FractalNoise2D noise(NoiseParams { .octaves = 0 });
	CHECK(noise.params().octaves == 1);

	FractalNoise2D many(NoiseParams { .octaves = 100 });
	CHECK(many.params().octaves == 16);
}

TEST_CASE("'FractalNoise2D' handles extreme inputs", "[tilestream::world::fractal_noise]")
{
	// Strongest allowed multipliers, octave frequencies reach far beyond the int32 lattice
	FractalNoise2D noise(NoiseParams {
		.seed = 9,
		.frequency = 1.0,
		.octaves = 16,
		.lacunarity = NoiseParams::MAX_LACUNARITY,
		.gain = NoiseParams::MAX_GAIN,
	});

	for (double c : { 0.5, 2.0e9, -2.1e9, 1.0e15, -3.0e30 }) {
		INFO("Position: " << c);
		double v = noise.sample(c, -c);
		CHECK(std::isfinite(v));
		CHECK(v >= -1.0);
		CHECK(v <= 1.0);
	}

	CHECK(FractalNoise2D::sampleSimplex(1, std::numeric_limits<double>::infinity(), 0.0) == 0.0);
	CHECK(FractalNoise2D::sampleSimplex(1, 0.5, std::numeric_limits<double>::quiet_NaN()) == 0.0);
	CHECK(noise.sample(std::numeric_limits<double>::quiet_NaN(), 1.0) == 0.0);
}

} // namespace tilestream::world
