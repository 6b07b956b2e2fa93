#pragma once

#include <tilestream/util/packed_color.hpp>
#include <tilestream/visibility.hpp>

#include <extras/enum_utils.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tilestream::world
{

enum class TerrainClass : uint8_t {
	Water,
	Grass,
	Sand,
	Rock,

	EnumSize
};

struct TerrainClassInfo {
	std::string name;
	// Color variants, at least one
	std::vector<PackedColorSrgb> colors;
	// Tiles of this class block movement
	bool collision = false;
};

// Immutable table of terrain classes, indexed by `TileInfo::class_index`.
// Built once and shared by reference between the classifier, the tile world and tests.
class TILESTREAM_API TerrainClassTable {
public:
	// Throws `Exception` with `InvalidConfig` if the table is empty, has more
	// than 256 classes (doesn't fit `class_index`) or a class has no colors
	explicit TerrainClassTable(std::vector<TerrainClassInfo> classes);

	size_t size() const noexcept { return m_classes.size(); }
	// No bounds checking
	const TerrainClassInfo &operator[](size_t index) const noexcept { return m_classes[index]; }
	std::span<const TerrainClassInfo> classes() const noexcept { return m_classes; }

	// Color of `variant` within class `index`, falls back
	// to `PackedColorSrgb::errorMagenta()` for out-of-range indices
	PackedColorSrgb colorOf(uint8_t index, uint8_t variant) const noexcept;
	bool hasCollision(uint8_t index) const noexcept;

	// Water, Grass, Sand, Rock with four color variants each.
	// Index of every class equals its `TerrainClass` value.
	static TerrainClassTable makeDefault();

private:
	std::vector<TerrainClassInfo> m_classes;
};

} // namespace tilestream::world

namespace extras
{

template<>
std::string_view enum_name(tilestream::world::TerrainClass value) noexcept;

}
