#pragma once

#include <tilestream/visibility.hpp>

#include <cstdint>

namespace tilestream
{

// Collection of hash utilities
namespace Hash
{

// Fixed-size (64-bit input) XXH64 with zero seed, can be useful to make
// well-distributed bits out of anything. XXH64 is bijective for 64-bit inputs
// so you can even directly compare hashes instead of keys <= 8 bytes.
TILESTREAM_API uint64_t xxh64Fixed(uint64_t data) noexcept;

// Pack two signed 32-bit lattice coordinates into one 64-bit key (bijective)
constexpr uint64_t packLattice(int32_t x, int32_t y) noexcept
{
	return (uint64_t(uint32_t(x)) << 32) | uint64_t(uint32_t(y));
}

// Hash a 2D integer lattice point within the domain defined by `seed`.
// Different seeds give unrelated values for the same point.
TILESTREAM_API uint64_t latticeHash(uint64_t seed, int32_t x, int32_t y) noexcept;

// Derive an independent sub-seed from `seed`, e.g. for per-octave or per-purpose noise
TILESTREAM_API uint64_t deriveSeed(uint64_t seed, uint64_t salt) noexcept;

} // namespace Hash

} // namespace tilestream
