#pragma once

#include <tilestream/visibility.hpp>

#include <glm/vec2.hpp>

#include <cstdint>

namespace tilestream::world
{

struct NoiseParams {
	// Upper bounds keeping every octave's frequency and amplitude finite
	constexpr static double MAX_LACUNARITY = 16.0;
	constexpr static double MAX_GAIN = 4.0;

	uint64_t seed = 0;
	// Base frequency, lattice cells per world tile
	double frequency = 0.01;
	int32_t octaves = 3;
	// Frequency multiplier between octaves
	double lacunarity = 2.0;
	// Amplitude multiplier between octaves
	double gain = 0.5;

	bool operator==(const NoiseParams &) const = default;
};

// Seeded 2D simplex noise summed over octaves (fBm).
// Output is normalized by the total amplitude and always lies in `[-1; 1]`.
// Immutable and thread-safe, sampling is a pure function of position and parameters.
class TILESTREAM_API FractalNoise2D {
public:
	// `octaves` below 1 is treated as 1
	explicit FractalNoise2D(const NoiseParams &params) noexcept;

	double sample(double x, double y) const noexcept;
	double sample(glm::dvec2 pos) const noexcept { return sample(pos.x, pos.y); }

	const NoiseParams &params() const noexcept { return m_params; }

	// Single simplex octave in `[-1; 1]` with gradients selected by `seed`.
	// Lattice repeats every 2^32 cells, non-finite input yields zero.
	static double sampleSimplex(uint64_t seed, double x, double y) noexcept;

private:
	constexpr static int32_t MAX_OCTAVES = 16;

	NoiseParams m_params;
	uint64_t m_octave_seeds[MAX_OCTAVES];
	double m_amplitude_sum = 1.0;
};

} // namespace tilestream::world
