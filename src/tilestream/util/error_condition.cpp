#include <tilestream/util/error_condition.hpp>

namespace tilestream
{

namespace
{

struct TileStreamErrorCategory final : std::error_category {
	const char *name() const noexcept override { return "TileStream error"; }

	std::string message(int code) const override
	{
		switch (static_cast<TileStreamErrc>(code)) {
		case TileStreamErrc::InvalidConfig: return "Configuration violates its invariants";
		case TileStreamErrc::OptionMissing: return "A config object has no requested option but user assumes it exists";
		case TileStreamErrc::FileNotFound: return "Requested file does not exist or is inaccessible";
		case TileStreamErrc::InvalidData: return "Input data is invalid/corrupt and can't be used";
		case TileStreamErrc::GenerationFailure: return "Chunk generation task could not produce its data";
		case TileStreamErrc::GenerationTimeout: return "Chunk generation did not complete in time";
		case TileStreamErrc::UnknownError: return "Unknown or unexpected error";
		// No `default` to make `-Werror -Wswitch` protection work
		}

		return "Unknown error";
	}
};

const TileStreamErrorCategory g_category;

} // namespace

std::error_condition make_error_condition(TileStreamErrc errc) noexcept
{
	return { static_cast<int>(errc), g_category };
}

} // namespace tilestream
