#include <tilestream/world/terrain_class.hpp>

#include <tilestream/util/error_condition.hpp>
#include <tilestream/util/exception.hpp>
#include <tilestream/util/log.hpp>

#include <initializer_list>
#include <string_view>

namespace tilestream::world
{

namespace
{

std::vector<PackedColorSrgb> parsePalette(std::initializer_list<std::string_view> hexes)
{
	std::vector<PackedColorSrgb> colors;
	colors.reserve(hexes.size());

	for (std::string_view hex : hexes) {
		auto result = PackedColorSrgb::parseHex(hex);
		if (!result) {
			Log::error("Bad palette color '{}'", hex);
			throw Exception::fromError(result.error(), "failed to parse terrain palette");
		}
		colors.push_back(result.value());
	}

	return colors;
}

} // namespace

TerrainClassTable::TerrainClassTable(std::vector<TerrainClassInfo> classes) : m_classes(std::move(classes))
{
	if (m_classes.empty()) {
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "terrain class table is empty");
	}

	if (m_classes.size() > 256) {
		Log::error("Terrain class table has {} entries, at most 256 are supported", m_classes.size());
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "too many terrain classes");
	}

	for (const TerrainClassInfo &info : m_classes) {
		if (info.colors.empty()) {
			Log::error("Terrain class '{}' has no color variants", info.name);
			throw Exception::fromError(TileStreamErrc::InvalidConfig, "terrain class without colors");
		}
	}
}

PackedColorSrgb TerrainClassTable::colorOf(uint8_t index, uint8_t variant) const noexcept
{
	if (index >= m_classes.size()) [[unlikely]] {
		return PackedColorSrgb::errorMagenta();
	}

	const auto &colors = m_classes[index].colors;
	return variant < colors.size() ? colors[variant] : PackedColorSrgb::errorMagenta();
}

bool TerrainClassTable::hasCollision(uint8_t index) const noexcept
{
	return index < m_classes.size() && m_classes[index].collision;
}

TerrainClassTable TerrainClassTable::makeDefault()
{
	std::vector<TerrainClassInfo> classes(extras::enum_size_v<TerrainClass>);

	auto &water = classes[extras::to_underlying(TerrainClass::Water)];
	water.name = extras::enum_name(TerrainClass::Water);
	water.colors = parsePalette({ "#0068d8", "#0064d1", "#0060c9", "#005cc1" });
	water.collision = true;

	auto &grass = classes[extras::to_underlying(TerrainClass::Grass)];
	grass.name = extras::enum_name(TerrainClass::Grass);
	grass.colors = parsePalette({ "#00b756", "#00af53", "#00a850", "#00a04b" });

	auto &sand = classes[extras::to_underlying(TerrainClass::Sand)];
	sand.name = extras::enum_name(TerrainClass::Sand);
	sand.colors = parsePalette({ "#ffcc4a", "#f7c546", "#efbd42", "#e8b941" });

	auto &rock = classes[extras::to_underlying(TerrainClass::Rock)];
	rock.name = extras::enum_name(TerrainClass::Rock);
	rock.colors = parsePalette({ "#916800", "#896200", "#825d00", "#7a5700" });
	rock.collision = true;

	return TerrainClassTable(std::move(classes));
}

} // namespace tilestream::world

namespace extras
{

using tilestream::world::TerrainClass;

template<>
std::string_view enum_name(TerrainClass value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case TerrainClass::Water:
		return "Water"sv;
	case TerrainClass::Grass:
		return "Grass"sv;
	case TerrainClass::Sand:
		return "Sand"sv;
	case TerrainClass::Rock:
		return "Rock"sv;
	case TerrainClass::EnumSize:
		break;
	}

	return "Unknown"sv;
}

} // namespace extras
