#pragma once

#include <tilestream/visibility.hpp>

#include <cpp/result.hpp>

#include <bit>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace tilestream
{

// Packed sRGB-encoded 8-bit RGBA color, alpha is linear.
// Bit-castable to `uint32_t` for bulk raster operations.
struct TILESTREAM_API PackedColorSrgb {
	constexpr PackedColorSrgb() = default;
	constexpr PackedColorSrgb(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) noexcept : r(r), g(g), b(b), a(a) {}

	bool operator==(const PackedColorSrgb &) const = default;

	// Pack to a single `uint32_t` without conversion; endian-dependent
	uint32_t toUint32() const noexcept { return std::bit_cast<uint32_t>(*this); }

	// Format as "#rrggbb" (or "#rrggbbaa" when not fully opaque)
	std::string toHex() const;

	// Parse "#rrggbb" or "#rrggbbaa" (leading '#' optional, case-insensitive).
	// Fails with `TileStreamErrc::InvalidData` on malformed input.
	static cpp::result<PackedColorSrgb, std::error_condition> parseHex(std::string_view text) noexcept;

	constexpr static PackedColorSrgb opaqueBlack() noexcept { return { 0, 0, 0, 255 }; }
	// Shown in place of colors that cannot be resolved
	constexpr static PackedColorSrgb errorMagenta() noexcept { return { 255, 0, 255, 255 }; }

	uint8_t r = 0;
	uint8_t g = 0;
	uint8_t b = 0;
	uint8_t a = 255;
};

} // namespace tilestream
