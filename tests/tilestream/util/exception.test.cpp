#include <tilestream/util/exception.hpp>

#include "../../tilestream_test_common.hpp"

#include <string>

namespace tilestream
{

TEST_CASE("'Exception' carries error condition and location", "[tilestream::exception]")
{
	const auto line = extras::source_location::current().line() + 1;
	Exception ex = Exception::fromError(TileStreamErrc::InvalidConfig, "bad things");

	CHECK(ex.error() == TileStreamErrc::InvalidConfig);
	CHECK(ex.where().line() == line);
	CHECK(std::string(ex.what()).find("bad things") != std::string::npos);

	CHECK_THROWS_MATCHES(throw ex, Exception, test::errcExceptionMatcher(TileStreamErrc::InvalidConfig));
}

TEST_CASE("'TileStreamErrc' category", "[tilestream::exception]")
{
	std::error_condition cond = TileStreamErrc::GenerationTimeout;
	CHECK(std::string(cond.category().name()) == "TileStream error");
	CHECK_FALSE(cond.message().empty());
	CHECK(cond != TileStreamErrc::GenerationFailure);
	CHECK(cond != std::errc::timed_out);
}

} // namespace tilestream
