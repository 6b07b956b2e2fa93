#include <tilestream/util/exception.hpp>

#include <fmt/format.h>

namespace tilestream
{

// Not defining inline to satisfy -Wweak-vtables
Exception::~Exception() = default;

Exception Exception::fromErrorCode(std::error_code ec, std::string_view details, Location loc)
{
	return { fmt::format("{} (code [{}:{}] {})", details, ec.category().name(), ec.value(), ec.message()),
		ec.default_error_condition(), loc };
}

Exception Exception::fromError(std::error_condition ec, std::string_view details, Location loc)
{
	return { fmt::format("{} (cond [{}:{}] {})", details, ec.category().name(), ec.value(), ec.message()), ec, loc };
}

Exception::Exception(std::string what, std::error_condition error, Location loc)
	: m_what(std::move(what)), m_error(error), m_where(loc)
{}

} // namespace tilestream
