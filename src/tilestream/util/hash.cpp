#include <tilestream/util/hash.hpp>

#include <bit>

namespace tilestream
{

namespace Hash
{

uint64_t xxh64Fixed(uint64_t data) noexcept
{
	constexpr uint64_t PRIME1 = 11400714785074694791ULL;
	constexpr uint64_t PRIME2 = 14029467366897019727ULL;
	constexpr uint64_t PRIME3 = 1609587929392839161ULL;
	constexpr uint64_t PRIME4 = 9650029242287828579ULL;
	// `prime5` + fixed 8-byte size
	constexpr uint64_t INIT = 2870177450012600261ULL + 8ULL;

	// Perform one single 64-bit processing step
	data = std::rotl(data * PRIME2, 31) * PRIME1;
	uint64_t result = std::rotl(INIT ^ data, 27) * PRIME1 + PRIME4;
	result ^= result >> 33;
	result *= PRIME2;
	result ^= result >> 29;
	result *= PRIME3;
	result ^= result >> 32;
	return result;
}

uint64_t latticeHash(uint64_t seed, int32_t x, int32_t y) noexcept
{
	// Pre-mix the seed so that neighbouring seeds don't produce correlated lattices
	return xxh64Fixed(packLattice(x, y) ^ xxh64Fixed(seed));
}

uint64_t deriveSeed(uint64_t seed, uint64_t salt) noexcept
{
	return xxh64Fixed(seed + 0x9E3779B97F4A7C15ULL * (salt + 1));
}

} // namespace Hash

} // namespace tilestream
