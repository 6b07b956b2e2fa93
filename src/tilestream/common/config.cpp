#include <tilestream/common/config.hpp>

#include <tilestream/util/error_condition.hpp>
#include <tilestream/util/exception.hpp>
#include <tilestream/util/log.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>

namespace tilestream
{

namespace
{

bool equalsNoCase(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size()) {
		return false;
	}

	for (size_t i = 0; i < a.size(); i++) {
		if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
			return false;
		}
	}

	return true;
}

std::string_view trim(std::string_view s) noexcept
{
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
		s.remove_prefix(1);
	}
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
		s.remove_suffix(1);
	}
	return s;
}

} // namespace

Config::Config(Scheme scheme)
{
	m_ini.SetUnicode();

	for (SchemeEntry &entry : scheme) {
		m_data[entry.section][entry.parameter_name] = std::move(entry.default_value);
	}
}

Config::Config(std::filesystem::path config_filepath, Scheme scheme) : m_path(std::move(config_filepath))
{
	m_ini.SetUnicode();

	std::error_code ec;
	if (std::filesystem::exists(m_path, ec)) {
		if (SI_Error err = m_ini.LoadFile(m_path.string().c_str()); err < 0) {
			Log::error("Can't load config file '{}' (SimpleIni error {})", m_path.string(), int(err));
			throw Exception::fromError(TileStreamErrc::InvalidConfig, "failed to parse config file");
		}
		Log::info("Loaded config file '{}'", m_path.string());
	} else {
		Log::info("Config file '{}' not found, using defaults", m_path.string());
	}

	for (const SchemeEntry &entry : scheme) {
		option_t value;
		const char *value_ptr = m_ini.GetValue(entry.section.c_str(), entry.parameter_name.c_str());

		if (!value_ptr) {
			const std::string value_str = optionToString(entry.default_value);
			// SimpleIni expects the comment prefix to be included
			const std::string comment = "; " + entry.description;
			m_ini.SetValue(entry.section.c_str(), entry.parameter_name.c_str(), value_str.c_str(), comment.c_str());
			value = entry.default_value;
		} else {
			value = optionFromString(value_ptr, entry.default_value.index());
		}

		m_data[entry.section][entry.parameter_name] = std::move(value);
	}
}

Config::~Config() noexcept = default;

void Config::patch(std::string_view section, std::string_view parameter_name, std::string_view value_string,
	bool save_to_config_file, Location loc)
{
	if (auto it_ext = m_data.find(section); it_ext != m_data.end()) {
		if (auto it_inter = it_ext->second.find(parameter_name); it_inter != it_ext->second.end()) {
			it_inter->second = optionFromString(value_string, it_inter->second.index(), loc);
			Log::debug("Patched option {}/{} = {}", section, parameter_name, optionToString(it_inter->second));

			if (save_to_config_file) {
				const std::string str = optionToString(it_inter->second);
				m_ini.SetValue(it_ext->first.c_str(), it_inter->first.c_str(), str.c_str());
			}

			return;
		}
	}

	Log::error("Option {}/{} not found for patching", section, parameter_name);
	throw Exception::fromError(TileStreamErrc::OptionMissing, "missing config option for patching", loc);
}

void Config::save() const
{
	if (m_path.empty()) {
		return;
	}

	std::error_code ec;
	if (m_path.has_parent_path()) {
		std::filesystem::create_directories(m_path.parent_path(), ec);
		if (ec) {
			throw Exception::fromErrorCode(ec, "can't create config file directory");
		}
	}

	if (SI_Error err = m_ini.SaveFile(m_path.string().c_str()); err < 0) {
		Log::error("Can't save config file '{}' (SimpleIni error {})", m_path.string(), int(err));
		throw Exception::fromError(TileStreamErrc::FileNotFound, "failed to write config file");
	}
}

const Config::option_t *Config::find(std::string_view section, std::string_view parameter_name) const noexcept
{
	auto it_ext = m_data.find(section);
	if (it_ext == m_data.end()) {
		return nullptr;
	}

	auto it_inter = it_ext->second.find(parameter_name);
	return it_inter != it_ext->second.end() ? &it_inter->second : nullptr;
}

std::optional<std::string> Config::optionString(std::string_view section, std::string_view parameter_name) const
{
	const option_t *opt = find(section, parameter_name);
	if (opt && std::holds_alternative<std::string>(*opt)) {
		return std::get<std::string>(*opt);
	}
	return std::nullopt;
}

std::optional<int64_t> Config::optionInt64(std::string_view section, std::string_view parameter_name) const
{
	const option_t *opt = find(section, parameter_name);
	if (opt && std::holds_alternative<int64_t>(*opt)) {
		return std::get<int64_t>(*opt);
	}
	return std::nullopt;
}

std::optional<double> Config::optionDouble(std::string_view section, std::string_view parameter_name) const
{
	const option_t *opt = find(section, parameter_name);
	if (opt && std::holds_alternative<double>(*opt)) {
		return std::get<double>(*opt);
	}
	return std::nullopt;
}

std::optional<bool> Config::optionBool(std::string_view section, std::string_view parameter_name) const
{
	const option_t *opt = find(section, parameter_name);
	if (opt && std::holds_alternative<bool>(*opt)) {
		return std::get<bool>(*opt);
	}
	return std::nullopt;
}

std::string Config::getString(std::string_view section, std::string_view parameter_name, Location loc) const
{
	if (auto opt = optionString(section, parameter_name); opt.has_value()) {
		return std::move(*opt);
	}

	Log::error("Option {}/{} (string) not found", section, parameter_name);
	throw Exception::fromError(TileStreamErrc::OptionMissing, "missing config option assumed existing", loc);
}

int64_t Config::getInt64(std::string_view section, std::string_view parameter_name, Location loc) const
{
	if (auto opt = optionInt64(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (int64) not found", section, parameter_name);
	throw Exception::fromError(TileStreamErrc::OptionMissing, "missing config option assumed existing", loc);
}

double Config::getDouble(std::string_view section, std::string_view parameter_name, Location loc) const
{
	if (auto opt = optionDouble(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (double) not found", section, parameter_name);
	throw Exception::fromError(TileStreamErrc::OptionMissing, "missing config option assumed existing", loc);
}

bool Config::getBool(std::string_view section, std::string_view parameter_name, Location loc) const
{
	if (auto opt = optionBool(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (bool) not found", section, parameter_name);
	throw Exception::fromError(TileStreamErrc::OptionMissing, "missing config option assumed existing", loc);
}

std::string Config::optionToString(const option_t &value)
{
	switch (value.index()) {
	case 0:
		static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, option_t>>);
		return std::get<std::string>(value);

	case 1:
		static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, option_t>>);
		return fmt::format("{}", std::get<int64_t>(value));

	case 2:
		static_assert(std::is_same_v<double, std::variant_alternative_t<2, option_t>>);
		// Shortest representation that round-trips
		return fmt::format("{}", std::get<double>(value));

	case 3:
		static_assert(std::is_same_v<bool, std::variant_alternative_t<3, option_t>>);
		return std::get<bool>(value) ? "true" : "false";

	default:
		static_assert(std::variant_size_v<option_t> == 4);
		return {};
	}
}

Config::option_t Config::optionFromString(std::string_view s, size_t type, Location loc)
{
	std::string_view t = trim(s);

	switch (type) {
	case 0:
		return std::string(t);

	case 1: {
		int64_t value = 0;
		auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
		if (ec == std::errc() && ptr == t.data() + t.size() && !t.empty()) {
			return value;
		}
		break;
	}

	case 2: {
		double value = 0.0;
		auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
		if (ec == std::errc() && ptr == t.data() + t.size() && !t.empty()) {
			return value;
		}
		break;
	}

	case 3:
		if (equalsNoCase(t, "true") || t == "1") {
			return true;
		}
		if (equalsNoCase(t, "false") || t == "0") {
			return false;
		}
		break;

	default:
		static_assert(std::variant_size_v<option_t> == 4);
		break;
	}

	Log::error("Can't convert option value '{}' to type #{}", s, type);
	throw Exception::fromError(TileStreamErrc::InvalidConfig, "malformed config option value", loc);
}

} // namespace tilestream
