#include <tilestream/world/fractal_noise.hpp>

#include <tilestream/util/hash.hpp>

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace tilestream::world
{

namespace
{

// Unit gradient at a lattice point, direction picked by the hash
glm::dvec2 gradient(uint64_t seed, int32_t x, int32_t y) noexcept
{
	uint64_t h = Hash::latticeHash(seed, x, y);
	// Top 53 bits give a uniform double in [0; 1)
	double angle = double(h >> 11) * (1.0 / double(1ull << 53)) * 2.0 * std::numbers::pi;
	return { std::cos(angle), std::sin(angle) };
}

// Lattice cell index wrapped into `int32_t`, `v` must be finite
int32_t wrapLattice(double v) noexcept
{
	constexpr double PERIOD = 4294967296.0;
	return int32_t(uint32_t(int64_t(std::fmod(v, PERIOD))));
}

int32_t wrapNext(int32_t v, int32_t d) noexcept
{
	return int32_t(uint32_t(v) + uint32_t(d));
}

} // namespace

FractalNoise2D::FractalNoise2D(const NoiseParams &params) noexcept : m_params(params)
{
	m_params.octaves = std::clamp(m_params.octaves, 1, MAX_OCTAVES);

	double amplitude = 1.0;
	m_amplitude_sum = 0.0;

	for (int32_t i = 0; i < m_params.octaves; i++) {
		m_octave_seeds[i] = Hash::deriveSeed(m_params.seed, uint64_t(i));
		m_amplitude_sum += amplitude;
		amplitude *= m_params.gain;
	}

	if (!(m_amplitude_sum > 0.0)) {
		// Non-positive gain sums can't be normalized, fall back to the first octave weight
		m_amplitude_sum = 1.0;
	}
}

double FractalNoise2D::sample(double x, double y) const noexcept
{
	double sum = 0.0;
	double frequency = m_params.frequency;
	double amplitude = 1.0;

	for (int32_t i = 0; i < m_params.octaves; i++) {
		sum += amplitude * sampleSimplex(m_octave_seeds[i], x * frequency, y * frequency);
		frequency *= m_params.lacunarity;
		amplitude *= m_params.gain;
	}

	const double value = sum / m_amplitude_sum;
	if (std::isnan(value)) [[unlikely]] {
		return 0.0;
	}
	return std::clamp(value, -1.0, 1.0);
}

double FractalNoise2D::sampleSimplex(uint64_t seed, double x, double y) noexcept
{
	// Skew/unskew factors: (sqrt(3) - 1) / 2 and (3 - sqrt(3)) / 6
	constexpr double F = 0.3660254037844386;
	constexpr double G = 0.21132486540518713;

	if (!std::isfinite(x) || !std::isfinite(y)) [[unlikely]] {
		return 0.0;
	}

	double skew = (x + y) * F;
	double x0d = std::floor(x + skew);
	double y0d = std::floor(y + skew);
	if (!std::isfinite(x0d) || !std::isfinite(y0d)) [[unlikely]] {
		return 0.0;
	}

	int32_t x0 = wrapLattice(x0d);
	int32_t y0 = wrapLattice(y0d);

	double unskew = (x0d + y0d) * G;
	glm::dvec2 r0(x - (x0d - unskew), y - (y0d - unskew));

	// Pick the simplex (upper or lower triangle) containing the point
	int32_t i1 = r0.x >= r0.y ? 1 : 0;
	int32_t j1 = 1 - i1;

	glm::dvec2 r1(r0.x - double(i1) + G, r0.y - double(j1) + G);
	glm::dvec2 r2(r0.x - 1.0 + 2.0 * G, r0.y - 1.0 + 2.0 * G);

	auto corner = [seed](glm::dvec2 r, int32_t cx, int32_t cy) {
		double t = 0.5 - glm::dot(r, r);
		if (t <= 0.0) {
			return 0.0;
		}
		t *= t;
		return t * t * glm::dot(gradient(seed, cx, cy), r);
	};

	double result = corner(r0, x0, y0) + corner(r1, wrapNext(x0, i1), wrapNext(y0, j1))
		+ corner(r2, wrapNext(x0, 1), wrapNext(y0, 1));
	// Brings unit-gradient extremes close to [-1; 1]
	return std::clamp(70.0 * result, -1.0, 1.0);
}

} // namespace tilestream::world
