#include <tilestream/util/packed_color.hpp>

#include <tilestream/util/error_condition.hpp>

#include <fmt/format.h>

namespace tilestream
{

namespace
{

int hexDigit(char c) noexcept
{
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

} // namespace

std::string PackedColorSrgb::toHex() const
{
	if (a == 255) {
		return fmt::format("#{:02x}{:02x}{:02x}", r, g, b);
	}
	return fmt::format("#{:02x}{:02x}{:02x}{:02x}", r, g, b, a);
}

cpp::result<PackedColorSrgb, std::error_condition> PackedColorSrgb::parseHex(std::string_view text) noexcept
{
	if (!text.empty() && text.front() == '#') {
		text.remove_prefix(1);
	}

	if (text.size() != 6 && text.size() != 8) {
		return cpp::failure(make_error_condition(TileStreamErrc::InvalidData));
	}

	uint8_t bytes[4] = { 0, 0, 0, 255 };
	for (size_t i = 0; i < text.size() / 2; i++) {
		int hi = hexDigit(text[2 * i]);
		int lo = hexDigit(text[2 * i + 1]);
		if (hi < 0 || lo < 0) {
			return cpp::failure(make_error_condition(TileStreamErrc::InvalidData));
		}
		bytes[i] = uint8_t(hi * 16 + lo);
	}

	return PackedColorSrgb(bytes[0], bytes[1], bytes[2], bytes[3]);
}

} // namespace tilestream
