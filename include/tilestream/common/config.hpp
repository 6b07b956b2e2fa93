#pragma once

#include <tilestream/visibility.hpp>

#include <extras/source_location.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#define SI_CONVERT_GENERIC
#include <simpleini/SimpleIni.h>

namespace tilestream
{

// Typed INI-backed option storage.
// The set of options and their types is fixed by the `Scheme` passed on construction,
// the file only overrides default values. Options absent from the file are
// written back (with their description as a comment) by `save()`.
class TILESTREAM_API Config {
public:
	using Location = extras::source_location;
	using option_t = std::variant<std::string, int64_t, double, bool>;

	struct SchemeEntry {
		std::string section;
		std::string parameter_name;
		std::string description;
		option_t default_value;
	};
	using Scheme = std::vector<SchemeEntry>;

	// In-memory config holding scheme defaults, `save()` is a no-op
	explicit Config(Scheme scheme);
	// Load values from `config_filepath` if it exists, defaults otherwise.
	// Throws `Exception` with `InvalidConfig` if the file exists but can't be parsed
	// or has a value not convertible to the scheme type.
	Config(std::filesystem::path config_filepath, Scheme scheme);
	Config(Config &&) = delete;
	Config(const Config &) = delete;
	Config &operator=(Config &&) = delete;
	Config &operator=(const Config &) = delete;
	~Config() noexcept;

	// Throws `Exception` with `OptionMissing` if there is no such option
	// or `InvalidConfig` if `value_string` does not convert to its type
	void patch(std::string_view section, std::string_view parameter_name, std::string_view value_string,
		bool save_to_config_file = false, Location loc = Location::current());

	// Write the INI file back (if file-backed). Throws `Exception` on I/O failure.
	void save() const;

	const std::filesystem::path &path() const noexcept { return m_path; }

	std::optional<std::string> optionString(std::string_view section, std::string_view parameter_name) const;
	std::optional<int64_t> optionInt64(std::string_view section, std::string_view parameter_name) const;
	std::optional<double> optionDouble(std::string_view section, std::string_view parameter_name) const;
	std::optional<bool> optionBool(std::string_view section, std::string_view parameter_name) const;

	// These throw `Exception` with `OptionMissing` instead of returning empty optionals
	std::string getString(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	int64_t getInt64(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	double getDouble(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	bool getBool(std::string_view section, std::string_view parameter_name, Location loc = Location::current()) const;

	static std::string optionToString(const option_t &value);
	// `type` is a `option_t` alternative index.
	// Throws `Exception` with `InvalidConfig` on malformed input.
	static option_t optionFromString(std::string_view s, size_t type, Location loc = Location::current());

private:
	const option_t *find(std::string_view section, std::string_view parameter_name) const noexcept;

	std::map<std::string, std::map<std::string, option_t, std::less<>>, std::less<>> m_data;
	std::filesystem::path m_path;
	CSimpleIniA m_ini;
};

} // namespace tilestream
