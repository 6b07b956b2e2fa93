#pragma once

#include <tilestream/visibility.hpp>

#include <extras/source_location.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <system_error>

namespace tilestream
{

// Base exception class for everything thrown by the library.
//
// Use this class directly rather than subclassing it per subsystem;
// reacting on the error kind is done through `error()`, which holds
// a `TileStreamErrc` (or `std::errc`) condition.
//
// Exceptions are reserved for non-recoverable situations, like building
// the streamer from invalid configuration. Expected failures, like a chunk
// generation attempt failing, travel as `cpp::result` values instead.
class TILESTREAM_API Exception : public std::exception {
public:
	using Location = extras::source_location;

	Exception() = delete;
	Exception(Exception &&) = default;
	Exception(const Exception &) = default;
	Exception &operator=(Exception &&) = default;
	Exception &operator=(const Exception &) = default;
	~Exception() override;

	const char *what() const noexcept override { return m_what.c_str(); }
	const std::error_condition &error() const noexcept { return m_error; }
	// Source location where the exception was thrown.
	// Pass it to `Log` to make messages appear as if made in that location.
	const Location &where() const noexcept { return m_where; }

	// Wrap an error code returned from an external library/platform call.
	// `what()` is formatted as "<details> (code [<category>:<value>] <message>)"
	static Exception fromErrorCode(std::error_code ec, std::string_view details, Location loc = Location::current());

	// Construct from an error condition, usually `TileStreamErrc` or `std::errc`.
	// `what()` is formatted as "<details> (cond [<category>:<value>] <message>)"
	static Exception fromError(std::error_condition ec, std::string_view details, Location loc = Location::current());

protected:
	Exception(std::string what, std::error_condition error, Location loc);

private:
	std::string m_what;
	std::error_condition m_error;
	Location m_where;
};

} // namespace tilestream
