#include <tilestream/common/config.hpp>
#include <tilestream/common/thread_pool.hpp>
#include <tilestream/stream/chunk_streamer.hpp>
#include <tilestream/stream/stream_settings.hpp>
#include <tilestream/stream/tile_world.hpp>
#include <tilestream/util/exception.hpp>
#include <tilestream/util/hash.hpp>
#include <tilestream/util/log.hpp>
#include <tilestream/world/terrain_class.hpp>

#include <cxxopts/cxxopts.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace
{

using namespace tilestream;

constexpr std::string_view CLI_SECTION_SEPARATOR = "__";

// Flies the viewport along a slow sine wave to the right
class DemoCamera final : public stream::IViewportProvider {
public:
	DemoCamera(glm::dvec2 size, double zoom, double speed) : m_size(size), m_zoom(zoom), m_speed(speed) {}

	stream::Viewport viewport() const override
	{
		return stream::Viewport { .center = m_center, .size = m_size, .zoom = m_zoom };
	}

	void advance() noexcept
	{
		m_time += 1.0;
		m_center.x = m_time * m_speed;
		m_center.y = std::sin(m_time * 0.01) * m_speed * 50.0;
	}

	glm::dvec2 center() const noexcept { return m_center; }

private:
	glm::dvec2 m_center { 0.0, 0.0 };
	glm::dvec2 m_size;
	double m_zoom;
	double m_speed;
	double m_time = 0.0;
};

cxxopts::Options makeCliOptions()
{
	cxxopts::Options options("tilestream_demo", "TileStream - streaming 2D tile world generator");
	Config::Scheme scheme = stream::StreamSettings::configScheme();

	for (Config::SchemeEntry &entry : scheme) {
		std::shared_ptr<cxxopts::Value> cli_value;
		switch (entry.default_value.index()) {
		case 0:
			static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, Config::option_t>>);
			cli_value = cxxopts::value<std::string>();
			break;

		case 1:
			static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, Config::option_t>>);
			cli_value = cxxopts::value<int64_t>();
			break;

		case 2:
			static_assert(std::is_same_v<double, std::variant_alternative_t<2, Config::option_t>>);
			cli_value = cxxopts::value<double>();
			break;

		case 3:
			static_assert(std::is_same_v<bool, std::variant_alternative_t<3, Config::option_t>>);
			// Allows `--section__flag` without `=true`
			cli_value = cxxopts::value<bool>()->implicit_value("true");
			break;

		default:
			static_assert(std::variant_size_v<Config::option_t> == 4);
			break;
		}

		options.add_options(entry.section)(fmt::format("{}{}{}", entry.section, CLI_SECTION_SEPARATOR,
											   entry.parameter_name),
			entry.description, cli_value);
	}

	// clang-format off: breaks nice chaining syntax
	options.add_options()
		("h,help", "Display help information")
		("c,config", "INI file with settings (created if missing when --save-config is given)", cxxopts::value<std::string>())
		("save-config", "Write the resulting config back to the file given by --config")
		("t,ticks", "Number of ticks to simulate", cxxopts::value<int64_t>()->default_value("600"))
		("tick-ms", "Sleep between ticks, milliseconds", cxxopts::value<int64_t>()->default_value("16"))
		("speed", "Camera speed, world pixels per tick", cxxopts::value<double>()->default_value("8"))
		("zoom", "Camera zoom", cxxopts::value<double>()->default_value("1"))
		("viewport", "Viewport size in pixels, WxH", cxxopts::value<std::string>()->default_value("1280x720"))
		("reroll-every", "Pick a new noise seed every N ticks, 0 - never", cxxopts::value<int64_t>()->default_value("0"))
		("log-level", "Log level: trace, debug, info, warn, error, fatal, off", cxxopts::value<std::string>()->default_value("info"));
	// clang-format on

	return options;
}

void patchConfig(const cxxopts::ParseResult &result, Config &config)
{
	for (const auto &keyvalue : result.arguments()) {
		size_t sep_idx = keyvalue.key().find(CLI_SECTION_SEPARATOR);
		if (sep_idx == std::string::npos) {
			continue;
		}

		std::string section = keyvalue.key().substr(0, sep_idx);
		std::string parameter = keyvalue.key().substr(sep_idx + CLI_SECTION_SEPARATOR.size());

		config.patch(section, parameter, keyvalue.value(), true);
	}
}

std::optional<glm::dvec2> parseViewportSize(std::string_view text)
{
	size_t sep = text.find('x');
	if (sep == std::string_view::npos) {
		return std::nullopt;
	}

	try {
		double w = std::stod(std::string(text.substr(0, sep)));
		double h = std::stod(std::string(text.substr(sep + 1)));
		if (w > 0.0 && h > 0.0) {
			return glm::dvec2(w, h);
		}
	}
	catch (const std::logic_error &) {
		// `std::invalid_argument` or `std::out_of_range`, reported below
	}

	return std::nullopt;
}

void logSummary(const stream::ChunkStreamer &streamer, const stream::TileWorld &world,
	const world::TerrainClassTable &classes, glm::dvec2 camera)
{
	std::array<size_t, 256> histogram {};
	size_t total_tiles = 0;

	for (const auto &[coord, data] : world.chunks()) {
		for (const world::TileInfo &tile : data.tiles()) {
			histogram[tile.class_index]++;
			total_tiles++;
		}
	}

	Log::info("Ticks: {}, epoch: {}", streamer.currentTick().value, streamer.epoch());
	Log::info("Chunks: {} generated, {} generating, {} pending, {} abandoned", streamer.generatedCount(),
		streamer.generatingCount(), streamer.pendingCount(), streamer.abandonedCount());
	Log::info("Tile world: {} chunks, {} collision tiles", world.chunkCount(), world.collisionTileCount());

	if (total_tiles > 0) {
		for (size_t i = 0; i < classes.size(); i++) {
			Log::info("  {:<8} {:6.2f}%", classes[i].name, 100.0 * double(histogram[i]) / double(total_tiles));
		}
	}

	if (auto tile = world.terrainAt(camera); tile.has_value()) {
		Log::info("Terrain under camera ({:.0f}, {:.0f}): {}", camera.x, camera.y, classes[tile->class_index].name);
	}
}

int runDemo(const cxxopts::ParseResult &args)
{
	std::string level_name = args["log-level"].as<std::string>();
	Log::Level level = Log::Level::Info;
	if (!Log::parseLevel(level_name, level)) {
		fmt::print(stderr, "Unknown log level '{}'\n", level_name);
		return EXIT_FAILURE;
	}
	Log::setLevel(level);

	std::optional<Config> config_storage;
	if (args.count("config")) {
		config_storage.emplace(args["config"].as<std::string>(), stream::StreamSettings::configScheme());
	} else {
		config_storage.emplace(stream::StreamSettings::configScheme());
	}
	Config &config = *config_storage;

	patchConfig(args, config);
	if (args.count("save-config")) {
		config.save();
	}

	stream::StreamSettings settings = stream::StreamSettings::fromConfig(config);

	auto viewport_size = parseViewportSize(args["viewport"].as<std::string>());
	if (!viewport_size) {
		fmt::print(stderr, "Invalid viewport size '{}', expected WxH\n", args["viewport"].as<std::string>());
		return EXIT_FAILURE;
	}

	const int64_t ticks = args["ticks"].as<int64_t>();
	const auto tick_interval = std::chrono::milliseconds(args["tick-ms"].as<int64_t>());
	const int64_t reroll_every = args["reroll-every"].as<int64_t>();

	const world::TerrainClassTable classes = world::TerrainClassTable::makeDefault();

	ThreadPool pool(ThreadPool::Config { .thread_count = size_t(settings.worker_threads) });
	DemoCamera camera(*viewport_size, args["zoom"].as<double>(), args["speed"].as<double>());
	stream::TileWorld tile_world(classes, world::CoordMapper(settings.tile_size, settings.chunk_size));

	stream::ChunkStreamer streamer(settings, pool, camera, tile_world, settings.makeGenerator(classes));

	for (int64_t tick = 1; tick <= ticks; tick++) {
		if (reroll_every > 0 && tick % reroll_every == 0) {
			settings.noise.seed = Hash::deriveSeed(settings.noise.seed, uint64_t(tick));
			Log::info("Re-rolling noise seed to {}", settings.noise.seed);

			streamer.reconfigure(settings, settings.makeGenerator(classes));
			tile_world.clear();
		}

		camera.advance();
		streamer.tick();

		if (tick_interval.count() > 0) {
			std::this_thread::sleep_for(tick_interval);
		}
	}

	logSummary(streamer, tile_world, classes, camera.center());
	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
	using tilestream::Log;

	try {
		cxxopts::Options options = makeCliOptions();

		auto parse = [&]() -> std::optional<cxxopts::ParseResult> {
			try {
				return options.parse(argc, argv);
			}
			catch (const cxxopts::exceptions::exception &ex) {
				fmt::print(stderr, "Invalid options provided, use -h (--help) to get usage help.\nError details:\n{}\n",
					ex.what());
				return std::nullopt;
			}
		};

		std::optional<cxxopts::ParseResult> parsed = parse();
		if (!parsed) {
			return EXIT_FAILURE;
		}
		const cxxopts::ParseResult &args = *parsed;

		if (args.count("help")) {
			fmt::print("{}\n", options.help());
			return EXIT_SUCCESS;
		}

		if (!args.unmatched().empty()) {
			fmt::print(stderr, "Unknown arguments provided:\n{}\n", args.unmatched());
			return EXIT_FAILURE;
		}

		if (int code = runDemo(args); code != EXIT_SUCCESS) {
			return code;
		}
	}
	catch (const tilestream::Exception &e) {
		Log::fatal("Uncaught tilestream::Exception instance");
		Log::fatal("what(): {}", e.what());
		auto loc = e.where();
		Log::fatal("where(): {}:{}", loc.file_name(), loc.line());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
	catch (const std::exception &e) {
		Log::fatal("Uncaught std::exception instance");
		Log::fatal("what(): {}", e.what());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
	catch (...) {
		Log::fatal("Uncaught exception of unknown type");
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}

	Log::info("Exiting normally");
	return EXIT_SUCCESS;
}
