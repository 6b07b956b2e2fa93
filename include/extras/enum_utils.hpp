#pragma once

#include <string_view>
#include <type_traits>

namespace extras
{

// Cast `enum class` value to its underlying type without much syntax noise
template<typename T>
inline constexpr std::underlying_type_t<T> to_underlying(T value) noexcept
{
	return static_cast<std::underlying_type_t<T>>(value);
}

// Number of elements in an enum whose last element is `EnumSize`
// and which has no manual value assignment:
// ```
// enum class Foo { A, B, C, EnumSize };
// static_assert(enum_size_v<Foo> == 3);
// ```
template<typename T>
constexpr inline std::underlying_type_t<T> enum_size_v = to_underlying(T::EnumSize);

// Value->name conversion. Only a declaration here, modules declaring
// enums provide specializations in their own translation units:
// ```
// template<> std::string_view extras::enum_name(foo::Foo value) noexcept;
// ```
template<typename T>
std::string_view enum_name(T value) noexcept;

} // namespace extras
