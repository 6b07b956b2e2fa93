#pragma once

#include <tilestream/visibility.hpp>

#include <system_error>

namespace tilestream
{

// This error code is supplemental to exception classes and is
// intended to be tested and reacted on by exception handling.
enum class TileStreamErrc : int {
	// Streaming/classification configuration violates its invariants
	InvalidConfig = 1,
	// A config object has no requested option but user assumes it exists
	OptionMissing = 2,
	// Requested file does not exist or is inaccessible
	FileNotFound = 3,
	// Input data is invalid/corrupt and can't be used
	InvalidData = 4,
	// Chunk generation task could not produce its data
	GenerationFailure = 5,
	// Chunk generation did not complete within the allowed number of ticks
	GenerationTimeout = 6,
	// Error is unknown or unexpected here
	UnknownError = 7,
};

// ADL-accessible factory for `std::error_condition { TileStreamErrc }`
TILESTREAM_API std::error_condition make_error_condition(TileStreamErrc errc) noexcept;

} // namespace tilestream

namespace std
{

// Mark `TileStreamErrc` as eligible for `std::error_condition`
template<>
struct is_error_condition_enum<tilestream::TileStreamErrc> : true_type {};

} // namespace std
