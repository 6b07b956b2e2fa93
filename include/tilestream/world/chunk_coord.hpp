#pragma once

#include <tilestream/util/hash.hpp>

#include <glm/vec2.hpp>

#include <bit>
#include <cstdint>
#include <cstdlib>
#include <functional>

namespace tilestream::world
{

// Integer position of a chunk in chunk space
struct ChunkCoord {
	int32_t x = 0;
	int32_t y = 0;

	constexpr bool operator==(const ChunkCoord &) const = default;

	constexpr ChunkCoord operator+(ChunkCoord other) const noexcept { return { x + other.x, y + other.y }; }
	constexpr ChunkCoord operator-(ChunkCoord other) const noexcept { return { x - other.x, y - other.y }; }

	// Bijective packing into one 64-bit key
	constexpr uint64_t packed() const noexcept { return Hash::packLattice(x, y); }
	uint64_t hash() const noexcept { return Hash::xxh64Fixed(packed()); }

	glm::ivec2 toVec() const noexcept { return { x, y }; }
	static ChunkCoord fromVec(glm::ivec2 v) noexcept { return { v.x, v.y }; }
};

// |dx| + |dy|, computed in 64 bits so extreme coordinates can't overflow
constexpr int64_t manhattanDistance(ChunkCoord a, ChunkCoord b) noexcept
{
	int64_t dx = int64_t(a.x) - int64_t(b.x);
	int64_t dy = int64_t(a.y) - int64_t(b.y);
	return (dx < 0 ? -dx : dx) + (dy < 0 ? -dy : dy);
}

} // namespace tilestream::world

template<>
struct std::hash<tilestream::world::ChunkCoord> {
	size_t operator()(const tilestream::world::ChunkCoord &coord) const noexcept { return size_t(coord.hash()); }
};
