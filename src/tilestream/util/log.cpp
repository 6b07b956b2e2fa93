#include <tilestream/util/log.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>

namespace tilestream
{

namespace
{

// Workers log from their own threads, level changes must be visible there
std::atomic<Log::Level> g_current_level = Log::Level::Trace;

// Thread-local "waterline cache" buffer to avoid allocations on each print
thread_local fmt::memory_buffer t_message_buffer;

fmt::text_style styleForLevel(Log::Level level) noexcept
{
	switch (level) {
	case Log::Level::Trace:
		return fmt::fg(fmt::color::wheat);
	case Log::Level::Debug:
		return fmt::fg(fmt::color::light_sea_green);
	case Log::Level::Info:
		return fmt::fg(fmt::color::green);
	case Log::Level::Warn:
		return fmt::fg(fmt::color::yellow);
	case Log::Level::Error:
		return fmt::fg(fmt::color::red);
	case Log::Level::Fatal:
		return fmt::emphasis::bold | fmt::fg(fmt::color::white) | fmt::bg(fmt::color::red);
	case Log::Level::Off:
		break;
	} // No `default` to make `-Werror -Wswitch` protection work

	return {};
}

} // namespace

Log::Level Log::level() noexcept
{
	return g_current_level.load(std::memory_order_relaxed);
}

void Log::setLevel(Level level) noexcept
{
	g_current_level.store(level, std::memory_order_relaxed);
	info("Changing log level to [{}]", extras::enum_name(level));
}

bool Log::parseLevel(std::string_view name, Level &out) noexcept
{
	constexpr Level ALL_LEVELS[] = { Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error,
		Level::Fatal, Level::Off };

	for (Level candidate : ALL_LEVELS) {
		std::string_view candidate_name = extras::enum_name(candidate);
		if (candidate_name.size() != name.size()) {
			continue;
		}

		bool equal = std::equal(name.begin(), name.end(), candidate_name.begin(), [](char a, char b) {
			return std::toupper(static_cast<unsigned char>(a)) == static_cast<unsigned char>(b);
		});

		if (equal) {
			out = candidate;
			return true;
		}
	}

	return false;
}

void Log::doLog(Level level, extras::source_location where, std::string_view format_str,
	fmt::format_args format_args) noexcept
{
	std::string_view text;

	try {
		auto &msgbuf = t_message_buffer;

		try {
			msgbuf.clear();
			fmt::vformat_to(std::back_inserter(msgbuf), format_str, format_args);
		}
		catch (const fmt::format_error &err) {
			// Broken format string is a bug at the call site, make it visible
			level = std::max(level, Level::Error);
			msgbuf.clear();
			fmt::format_to(std::back_inserter(msgbuf), "Caught fmt::format_error when trying to log: {}", err.what());
		}
		catch (const std::bad_alloc &err) {
			level = std::max(level, Level::Error);
			msgbuf.clear();
			fmt::format_to(std::back_inserter(msgbuf), "Caught std::bad_alloc when trying to log: {}", err.what());
		}

		text = { msgbuf.data(), msgbuf.size() };
	}
	catch (...) {
		// Failure inside catch clauses, nothing potentially-throwing can be done here
		level = std::max(level, Level::Error);
		text = "Caught [unknown exception] when trying to log";
	}

	const auto pid = getpid();
	const auto tid = gettid();

	try {
		// `stdout` for `X <= Info`, `stderr` for `X >= Warn`
		FILE *sink = stdout;
		if (level >= Level::Warn) {
			// Don't interleave messages when both streams go to the same output
			fflush(stdout);
			sink = stderr;
		}

		fmt::print(sink, "[{:%F %T}][{} {}][{:s}:{:d}][{:s}] {:s}\n", std::chrono::system_clock::now(), pid, tid,
			where.file_name(), where.line(), fmt::styled(extras::enum_name(level), styleForLevel(level)), text);
	}
	catch (const std::system_error &err) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] std::system_error when printing log: %s:%d (%s)\n",
			pid, tid, where.file_name(), unsigned(where.line()), err.code().category().name(), err.code().value(),
			err.what());
	}
	catch (...) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] Unknown exception when printing log!\n", pid, tid,
			where.file_name(), unsigned(where.line()));
	}
}

} // namespace tilestream

namespace extras
{

using tilestream::Log;

template<>
std::string_view enum_name(Log::Level value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case Log::Level::Trace:
		return "TRACE"sv;
	case Log::Level::Debug:
		return "DEBUG"sv;
	case Log::Level::Info:
		return "INFO"sv;
	case Log::Level::Warn:
		return "WARN"sv;
	case Log::Level::Error:
		return "ERROR"sv;
	case Log::Level::Fatal:
		return "FATAL"sv;
	case Log::Level::Off:
		return "OFF"sv;
	} // No `default` to make `-Werror -Wswitch` protection work

	return "UNKNOWN"sv;
}

} // namespace extras
