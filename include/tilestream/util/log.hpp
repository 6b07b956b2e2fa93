#pragma once

#include <tilestream/visibility.hpp>

#include <extras/enum_utils.hpp>
#include <extras/source_location.hpp>

#include <fmt/core.h>

#include <string_view>
#include <type_traits>

namespace tilestream
{

class TILESTREAM_API Log {
public:
	// Levels are ordered by increasing severity, it's valid to compare them as integers
	enum class Level : int {
		// Per-item details of some algorithm (e.g. every admitted chunk coordinate).
		// Noisy, should generally be disabled outside of debugging sessions.
		Trace,
		// Low-level workflow information (e.g. a chunk was dispatched or applied)
		Debug,
		// High-level workflow information (startup, settings, invalidations, summaries)
		Info,
		// Something failed but the current action can still be completed,
		// e.g. a chunk generation attempt failed and will be retried
		Warn,
		// Something failed and the current action cannot be completed,
		// e.g. a chunk was dead-lettered after exhausting its retries
		Error,
		// Further execution is impossible
		Fatal,

		Off // Not actually a logging level, use it with `setLevel` to disable logging completely
	};

	// Format string implicitly tagged with the call site.
	// Constructed from a string literal (or `std::string_view`) at the call site,
	// so the default `current()` argument captures the caller's location.
	struct Format {
		template<typename S>
			requires std::is_convertible_v<const S &, std::string_view>
		Format(const S &str, extras::source_location loc = extras::source_location::current()) noexcept
			: text(str), where(loc)
		{}

		std::string_view text;
		extras::source_location where;
	};

	template<typename... Args>
	static void log(Level level, extras::source_location where, std::string_view format_str,
		const Args &...args) noexcept
	{
		if (!willBeLogged(level)) {
			return;
		}
		doLog(level, where, format_str, fmt::make_format_args(args...));
	}

	template<typename... Args>
	static void trace(Format format, const Args &...args) noexcept
	{
		log(Level::Trace, format.where, format.text, args...);
	}

	template<typename... Args>
	static void debug(Format format, const Args &...args) noexcept
	{
		log(Level::Debug, format.where, format.text, args...);
	}

	template<typename... Args>
	static void info(Format format, const Args &...args) noexcept
	{
		log(Level::Info, format.where, format.text, args...);
	}

	template<typename... Args>
	static void warn(Format format, const Args &...args) noexcept
	{
		log(Level::Warn, format.where, format.text, args...);
	}

	template<typename... Args>
	static void error(Format format, const Args &...args) noexcept
	{
		log(Level::Error, format.where, format.text, args...);
	}

	template<typename... Args>
	static void fatal(Format format, const Args &...args) noexcept
	{
		log(Level::Fatal, format.where, format.text, args...);
	}

	// Initially `Trace` regardless of build type (i.e. everything is logged)
	static Level level() noexcept;
	static void setLevel(Level level) noexcept;
	static bool willBeLogged(Level level) noexcept { return level >= Log::level(); }

	// Parse level name as printed in log lines (case-insensitive).
	// Returns `false` and leaves `out` untouched if the name is unknown.
	static bool parseLevel(std::string_view name, Level &out) noexcept;

private:
	Log() = delete;

	static void doLog(Level level, extras::source_location where, std::string_view format_str,
		fmt::format_args format_args) noexcept;
};

} // namespace tilestream

namespace extras
{

template<>
std::string_view enum_name(tilestream::Log::Level value) noexcept;

}
