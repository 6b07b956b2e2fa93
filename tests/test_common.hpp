#pragma once

#define CATCH_CONFIG_EXPERIMENTAL_REDIRECT
#include <catch2/catch.hpp>

#include <tilestream/util/packed_color.hpp>

#include <glm/vec2.hpp>

#include <system_error>

namespace Catch
{

template<>
struct StringMaker<std::error_code> {
	static std::string convert(const std::error_code &ec);
};

template<>
struct StringMaker<std::error_condition> {
	static std::string convert(const std::error_condition &ec);
};

// Prints "#rrggbb[aa]"
template<>
struct StringMaker<tilestream::PackedColorSrgb> {
	static std::string convert(tilestream::PackedColorSrgb color);
};

#define MAKE_GLM_VEC_STRINGIZER(L, T) \
	template<> \
	struct StringMaker<glm::vec<L, T>> { \
		static std::string convert(const glm::vec<L, T> &value); \
	}

MAKE_GLM_VEC_STRINGIZER(2, double);
MAKE_GLM_VEC_STRINGIZER(2, int32_t);

#undef MAKE_GLM_VEC_STRINGIZER

} // namespace Catch
