#pragma once

#include <version>

#if defined(__cpp_lib_source_location) && __cpp_lib_source_location >= 201907L

	#include <source_location>

namespace extras
{

using source_location = std::source_location;

}

#else

	#include <cstdint>

namespace extras
{

// Minimal stand-in for `std::source_location` (file and line only)
// for standard libraries that do not ship it yet. GCC/Clang builtins.
class source_location final {
public:
	constexpr static source_location current(const char *file = __builtin_FILE(),
		uint_least32_t line = __builtin_LINE()) noexcept
	{
		source_location loc;
		loc.m_file = file;
		loc.m_line = line;
		return loc;
	}

	constexpr const char *file_name() const noexcept { return m_file; }
	constexpr uint_least32_t line() const noexcept { return m_line; }

private:
	const char *m_file = "unknown";
	uint_least32_t m_line = 0;
};

} // namespace extras

#endif
