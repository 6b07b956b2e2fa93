#include <tilestream/stream/chunk_streamer.hpp>

#include <tilestream/common/thread_pool.hpp>

#include "../../tilestream_test_common.hpp"

#include <algorithm>
#include <memory>
#include <unordered_set>

namespace tilestream::stream
{

namespace
{

// 4x4 tiles of 4 px => 16 px chunks, no buffer
StreamSettings smallSettings(int32_t max_concurrent, int32_t apply_per_tick)
{
	StreamSettings s;
	s.chunk_size = 4;
	s.tile_size = 4;
	s.buffer = 0;
	s.max_concurrent = max_concurrent;
	s.apply_per_tick = apply_per_tick;
	return s;
}

// Covers chunks (0, 0) - (1, 1), centered in chunk (1, 1)
const Viewport VIEWPORT_2X2 { .center = { 16.0, 16.0 }, .size = { 30.0, 30.0 }, .zoom = 1.0 };
// Covers chunks (0, 0) - (4, 0)
const Viewport VIEWPORT_5X1 { .center = { 40.0, 8.0 }, .size = { 70.0, 1.0 }, .zoom = 1.0 };

struct StreamerFixture {
	StreamerFixture(StreamSettings settings, Viewport vp, bool gate_open)
		: generator(std::make_shared<test::ScriptedGenerator>(gate_open))
		, pool(ThreadPool::Config { .thread_count = 4 })
		, viewport(vp)
		, streamer(settings, pool, viewport, renderer, generator)
	{}

	~StreamerFixture()
	{
		// Blocked workers would hang the pool destructor
		generator->openGate();
	}

	// Tick until `pred` holds, checking basic invariants after every tick
	bool tickUntil(const std::function<bool()> &pred)
	{
		return test::waitUntil([&]() {
			streamer.tick();
			checkInvariants();
			return pred();
		});
	}

	void checkInvariants()
	{
		REQUIRE(streamer.generatingCount() <= size_t(streamer.settings().max_concurrent));
		REQUIRE(streamer.lastTickStats().applied <= uint32_t(streamer.settings().apply_per_tick));
		REQUIRE(streamer.queuedCount() == streamer.pendingCount());

		// Tracking sets are pairwise disjoint over the area the viewports cover
		for (int32_t y = -2; y <= 3; y++) {
			for (int32_t x = -2; x <= 6; x++) {
				const world::ChunkCoord c { x, y };
				const int memberships = int(streamer.isQueued(c)) + int(streamer.isGenerating(c))
					+ int(streamer.isGenerated(c)) + int(streamer.isAbandoned(c));
				INFO("Chunk: (" << x << ", " << y << ")");
				REQUIRE(memberships <= 1);
			}
		}
	}

	std::shared_ptr<test::ScriptedGenerator> generator;
	ThreadPool pool;
	test::FixedViewport viewport;
	test::RecordingRenderer renderer;
	ChunkStreamer streamer;
};

} // namespace

TEST_CASE("'ChunkStreamer' 2x2 viewport yields four chunks", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(8, 8), VIEWPORT_2X2, false);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 4);
	CHECK(fx.streamer.lastTickStats().dispatched == 4);
	CHECK(fx.streamer.generatingCount() == 4);
	CHECK(fx.streamer.pendingCount() == 0);

	for (world::ChunkCoord c : { world::ChunkCoord { 0, 0 }, world::ChunkCoord { 1, 0 }, world::ChunkCoord { 0, 1 },
			 world::ChunkCoord { 1, 1 } }) {
		CHECK(fx.streamer.stateOf(c) == ChunkState::Generating);
	}
	CHECK(fx.streamer.stateOf({ 2, 2 }) == ChunkState::Unseen);

	fx.generator->openGate();
	REQUIRE(fx.tickUntil([&]() { return fx.streamer.generatedCount() == 4; }));

	CHECK(fx.streamer.generatingCount() == 0);
	CHECK(fx.renderer.presented.size() == 4);
	CHECK(fx.streamer.isGenerated({ 0, 0 }));
	CHECK(fx.streamer.isGenerated({ 1, 1 }));
	CHECK_FALSE(fx.streamer.isGenerated({ 2, 1 }));
}

TEST_CASE("'ChunkStreamer' never admits a chunk twice", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(8, 8), VIEWPORT_2X2, false);

	for (int i = 0; i < 20; i++) {
		fx.streamer.tick();
		fx.checkInvariants();
	}

	CHECK(fx.streamer.generatingCount() == 4);
	CHECK(test::waitUntil([&]() { return fx.generator->waitingCount() == 4; }));
	CHECK(fx.generator->callCount() == 4);

	fx.generator->openGate();
	REQUIRE(fx.tickUntil([&]() { return fx.streamer.generatedCount() == 4; }));

	// Keep ticking over the same area, nothing new must be generated
	for (int i = 0; i < 20; i++) {
		fx.streamer.tick();
	}

	CHECK(fx.generator->callCount() == 4);
	auto coords = fx.renderer.coords();
	std::unordered_set<world::ChunkCoord> unique(coords.begin(), coords.end());
	CHECK(coords.size() == 4);
	CHECK(unique.size() == 4);
}

TEST_CASE("'ChunkStreamer' concurrency is bounded by K", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(2, 8), VIEWPORT_5X1, false);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 5);
	CHECK(fx.streamer.generatingCount() == 2);
	CHECK(fx.streamer.pendingCount() == 3);

	// Blocked workers don't free slots
	REQUIRE(test::waitUntil([&]() { return fx.generator->waitingCount() == 2; }));
	fx.streamer.tick();
	CHECK(fx.streamer.generatingCount() == 2);
	CHECK(fx.streamer.pendingCount() == 3);
	CHECK(fx.generator->callCount() == 2);

	fx.generator->openGate();
	REQUIRE(fx.tickUntil([&]() { return fx.streamer.generatedCount() == 5; }));

	CHECK(fx.generator->maxInFlight() <= 2);
	CHECK(fx.renderer.presented.size() == 5);
}

TEST_CASE("'ChunkStreamer' applies at most A chunks per tick", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(8, 2), VIEWPORT_5X1, false);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().dispatched == 5);
	CHECK(fx.streamer.lastTickStats().applied == 0);

	// Let every result land in the channel before applying
	fx.generator->openGate();
	REQUIRE(test::waitUntil([&]() { return fx.streamer.completedBacklog() == 5; }));

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().applied == 2);
	CHECK(fx.streamer.generatedCount() == 2);
	CHECK(fx.renderer.presented.size() == 2);
	// The rest waits in the channel
	CHECK(fx.streamer.completedBacklog() == 3);
	CHECK(fx.streamer.generatingCount() == 3);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().applied == 2);
	CHECK(fx.streamer.generatedCount() == 4);
	CHECK(fx.streamer.completedBacklog() == 1);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().applied == 1);
	CHECK(fx.streamer.generatedCount() == 5);
	CHECK(fx.streamer.generatingCount() == 0);
}

TEST_CASE("'ChunkStreamer' generates nearest chunks first", "[tilestream::stream::chunk_streamer]")
{
	// One chunk at a time makes presentation order equal to dispatch order
	StreamerFixture fx(smallSettings(1, 8), VIEWPORT_2X2, true);

	REQUIRE(fx.tickUntil([&]() { return fx.streamer.generatedCount() == 4; }));

	auto coords = fx.renderer.coords();
	REQUIRE(coords.size() == 4);
	// Viewport center is in chunk (1, 1); ties keep row-major order
	CHECK(coords[0] == (world::ChunkCoord { 1, 1 }));
	CHECK(coords[1] == (world::ChunkCoord { 1, 0 }));
	CHECK(coords[2] == (world::ChunkCoord { 0, 1 }));
	CHECK(coords[3] == (world::ChunkCoord { 0, 0 }));
}

TEST_CASE("'ChunkStreamer' retries failed chunks", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(4, 8), VIEWPORT_2X2, true);
	fx.generator->failCoord({ 0, 0 }, 3);

	uint32_t failures = 0;
	REQUIRE(fx.tickUntil([&]() {
		failures += fx.streamer.lastTickStats().failed;
		return fx.streamer.generatedCount() == 4;
	}));

	CHECK(failures == 3);
	CHECK(fx.generator->callCount() == 4 + 3);
	CHECK(fx.streamer.isGenerated({ 0, 0 }));
	// Reset once generated
	CHECK(fx.streamer.failureCount({ 0, 0 }) == 0);
	CHECK(fx.renderer.presented.size() == 4);
}

TEST_CASE("'ChunkStreamer' abandons chunks after max retries", "[tilestream::stream::chunk_streamer]")
{
	StreamSettings settings = smallSettings(4, 8);
	settings.max_retries = 2;

	StreamerFixture fx(settings, VIEWPORT_2X2, true);
	fx.generator->failCoord({ 0, 0 }, UINT32_MAX);

	REQUIRE(fx.tickUntil([&]() {
		return fx.streamer.generatedCount() == 3 && fx.streamer.stateOf({ 0, 0 }) == ChunkState::Abandoned;
	}));

	CHECK(fx.streamer.abandonedCount() == 1);
	// First attempt plus two retries
	CHECK(fx.generator->callCount() == 3 + 3);

	// Abandoned chunks are not admitted again
	for (int i = 0; i < 10; i++) {
		fx.streamer.tick();
	}
	CHECK(fx.generator->callCount() == 3 + 3);
	CHECK(fx.streamer.stateOf({ 0, 0 }) == ChunkState::Abandoned);

	// Until everything is invalidated
	fx.streamer.invalidateAll();
	CHECK(fx.streamer.stateOf({ 0, 0 }) == ChunkState::Unseen);
	CHECK(fx.streamer.abandonedCount() == 0);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 4);
}

TEST_CASE("'ChunkStreamer' drops results from before invalidation", "[tilestream::stream::chunk_streamer]")
{
	// A = 4 so the first apply only sees the stale results
	StreamerFixture fx(smallSettings(8, 4), VIEWPORT_2X2, false);

	fx.streamer.tick();
	CHECK(fx.streamer.generatingCount() == 4);
	CHECK(fx.streamer.epoch() == 0);

	fx.streamer.invalidateAll();
	CHECK(fx.streamer.epoch() == 1);
	CHECK(fx.streamer.generatingCount() == 0);
	CHECK(fx.streamer.pendingCount() == 0);
	CHECK(fx.streamer.stateOf({ 1, 1 }) == ChunkState::Unseen);

	// Old tasks complete without anyone ticking
	fx.generator->openGate();
	REQUIRE(test::waitUntil([&]() { return fx.streamer.completedBacklog() == 4; }));

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 4);
	CHECK(fx.streamer.lastTickStats().dispatched == 4);
	CHECK(fx.streamer.lastTickStats().discarded == 4);
	CHECK(fx.streamer.lastTickStats().applied == 0);
	CHECK(fx.renderer.presented.empty());

	REQUIRE(fx.tickUntil([&]() { return fx.streamer.generatedCount() == 4; }));
	CHECK(fx.renderer.presented.size() == 4);
	CHECK(fx.generator->callCount() == 8);
}

TEST_CASE("'ChunkStreamer' expires stuck generations", "[tilestream::stream::chunk_streamer]")
{
	// A = 4 so the first apply only sees the late results
	StreamSettings settings = smallSettings(4, 4);
	settings.generation_timeout_ticks = 2;

	StreamerFixture fx(settings, VIEWPORT_2X2, false);

	fx.streamer.tick();
	CHECK(fx.streamer.generatingCount() == 4);

	fx.streamer.tick();
	fx.streamer.tick();
	CHECK(fx.streamer.generatingCount() == 4);
	CHECK(fx.streamer.lastTickStats().timed_out == 0);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().timed_out == 4);
	CHECK(fx.streamer.generatingCount() == 0);
	CHECK(fx.streamer.pendingCount() == 4);
	CHECK(fx.streamer.failureCount({ 0, 0 }) == 1);

	// Late results of expired dispatches
	fx.generator->openGate();
	REQUIRE(test::waitUntil([&]() { return fx.streamer.completedBacklog() == 4; }));

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().dispatched == 4);
	CHECK(fx.streamer.lastTickStats().discarded == 4);
	CHECK(fx.streamer.lastTickStats().applied == 0);

	REQUIRE(fx.tickUntil([&]() { return fx.streamer.generatedCount() == 4; }));
	CHECK(fx.renderer.presented.size() == 4);
}

TEST_CASE("'ChunkStreamer' generator replacement invalidates", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(8, 8), VIEWPORT_2X2, true);

	REQUIRE(fx.tickUntil([&]() { return fx.streamer.generatedCount() == 4; }));

	auto other = std::make_shared<test::ScriptedGenerator>();
	fx.streamer.setGenerator(other);
	CHECK(fx.streamer.epoch() == 1);
	CHECK(fx.streamer.generatedCount() == 0);

	REQUIRE(fx.tickUntil([&]() { return fx.streamer.generatedCount() == 4; }));
	CHECK(other->callCount() == 4);
	CHECK(fx.renderer.presented.size() == 8);

	SECTION("Reconfiguring scheduling only keeps chunks")
	{
		StreamSettings settings = fx.streamer.settings();
		settings.apply_per_tick = 1;
		fx.streamer.reconfigure(settings, other);

		CHECK(fx.streamer.epoch() == 1);
		CHECK(fx.streamer.generatedCount() == 4);
	}

	SECTION("Reconfiguring noise invalidates")
	{
		StreamSettings settings = fx.streamer.settings();
		settings.noise.seed++;
		fx.streamer.reconfigure(settings, other);

		CHECK(fx.streamer.epoch() == 2);
		CHECK(fx.streamer.generatedCount() == 0);
	}

	SECTION("Null generator is rejected")
	{
		CHECK_THROWS_MATCHES(fx.streamer.setGenerator(nullptr), Exception,
			test::errcExceptionMatcher(TileStreamErrc::InvalidConfig));
		CHECK(fx.streamer.epoch() == 1);
	}
}

TEST_CASE("'ChunkStreamer' rejects invalid construction", "[tilestream::stream::chunk_streamer]")
{
	ThreadPool pool(ThreadPool::Config { .thread_count = 1 });
	test::FixedViewport viewport(VIEWPORT_2X2);
	test::RecordingRenderer renderer;
	auto generator = std::make_shared<test::ScriptedGenerator>();
	auto invalid = test::errcExceptionMatcher(TileStreamErrc::InvalidConfig);

	StreamSettings bad = smallSettings(0, 1);
	CHECK_THROWS_MATCHES(ChunkStreamer(bad, pool, viewport, renderer, generator), Exception, invalid);

	bad = smallSettings(1, 0);
	CHECK_THROWS_MATCHES(ChunkStreamer(bad, pool, viewport, renderer, generator), Exception, invalid);

	bad = smallSettings(1, 1);
	bad.chunk_size = 0;
	CHECK_THROWS_MATCHES(ChunkStreamer(bad, pool, viewport, renderer, generator), Exception, invalid);

	CHECK_THROWS_MATCHES(ChunkStreamer(smallSettings(1, 1), pool, viewport, renderer, nullptr), Exception, invalid);
}

TEST_CASE("'ChunkStreamer' skips admission for unusable viewport", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(8, 8), Viewport { .center = { 0.0, 0.0 }, .size = { 10.0, 10.0 }, .zoom = 0.0 },
		true);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 0);
	CHECK(fx.streamer.currentTick() == StreamTickId(1));

	fx.viewport.set(VIEWPORT_2X2);
	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 4);
}

TEST_CASE("'ChunkStreamer' re-queues a failed chunk immediately", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(4, 8), VIEWPORT_2X2, false);
	fx.generator->failCoord({ 0, 0 }, 1);

	fx.streamer.tick();
	CHECK(fx.streamer.generatingCount() == 4);

	fx.generator->openGate();
	REQUIRE(test::waitUntil(
		[&]() { return fx.streamer.failedBacklog() == 1 && fx.streamer.completedBacklog() == 3; }));

	// Failure drain runs after dispatch, so the chunk waits in the queue until the next tick
	fx.streamer.tick();
	fx.checkInvariants();
	CHECK(fx.streamer.lastTickStats().failed == 1);
	CHECK(fx.streamer.lastTickStats().applied == 3);
	CHECK(fx.streamer.stateOf({ 0, 0 }) == ChunkState::Queued);
	CHECK(fx.streamer.pendingCount() == 1);
	CHECK(fx.streamer.failureCount({ 0, 0 }) == 1);

	fx.streamer.tick();
	fx.checkInvariants();
	CHECK(fx.streamer.lastTickStats().dispatched == 1);
	CHECK((fx.streamer.stateOf({ 0, 0 }) == ChunkState::Generating
		|| fx.streamer.stateOf({ 0, 0 }) == ChunkState::Generated));

	REQUIRE(fx.tickUntil([&]() { return fx.streamer.isGenerated({ 0, 0 }); }));
	CHECK(fx.generator->callCount() == 5);
}

TEST_CASE("'ChunkStreamer' skips oversized visible areas", "[tilestream::stream::chunk_streamer]")
{
	// Zoomed out so far that 16 px chunks span a ~1.3e9 x 7.2e8 px area
	StreamerFixture fx(smallSettings(8, 8),
		Viewport { .center = { 0.0, 0.0 }, .size = { 1280.0, 720.0 }, .zoom = 1.0e-6 }, true);

	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 0);
	CHECK(fx.streamer.pendingCount() == 0);
	CHECK(fx.generator->callCount() == 0);

	// 255 x 255 chunks of 16 px fit under the limit
	const double side = 255.0 * 16.0 - 1.0;
	fx.viewport.set(Viewport { .center = { 8.0, 8.0 }, .size = { side, side }, .zoom = 1.0 });
	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 255u * 255u);
	CHECK(int64_t(fx.streamer.lastTickStats().admitted) <= ChunkStreamer::MAX_ADMISSION_AREA);
}

TEST_CASE("'ChunkStreamer' ignores chunks beyond coordinate range", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(8, 8),
		Viewport { .center = { 1.0e13, -1.0e13 }, .size = { 30.0, 30.0 }, .zoom = 1.0 }, true);

	// Chunk coordinates saturate, nothing there can be generated
	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 0);

	// Chunk 6e8 fits int32 but its tiles (4 per chunk) don't
	fx.viewport.set(Viewport { .center = { 6.0e8 * 16.0 + 8.0, 8.0 }, .size = { 1.0, 1.0 }, .zoom = 1.0 });
	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 0);

	// Chunk 5e8 is still in range
	const world::ChunkCoord far { 500'000'000, 0 };
	fx.viewport.set(Viewport { .center = { 5.0e8 * 16.0 + 8.0, 8.0 }, .size = { 1.0, 1.0 }, .zoom = 1.0 });
	fx.streamer.tick();
	CHECK(fx.streamer.lastTickStats().admitted == 1);

	REQUIRE(fx.tickUntil([&]() { return fx.streamer.isGenerated(far); }));
	REQUIRE(fx.renderer.presented.size() == 1);
	CHECK(fx.renderer.presented[0].startTile() == glm::ivec2(2'000'000'000, 0));
}

TEST_CASE("'ChunkStreamer' keeps chunks pending when dispatch fails", "[tilestream::stream::chunk_streamer]")
{
	StreamerFixture fx(smallSettings(8, 8), VIEWPORT_2X2, true);

	fx.pool.stop();
	CHECK_THROWS_MATCHES(fx.streamer.tick(), Exception, test::errcExceptionMatcher(TileStreamErrc::UnknownError));

	// Nothing claims to be generating without a task behind it
	CHECK(fx.streamer.generatingCount() == 0);
	CHECK(fx.streamer.pendingCount() == 4);
	CHECK(fx.streamer.queuedCount() == 4);
	CHECK(fx.streamer.stateOf({ 1, 1 }) == ChunkState::Queued);
	fx.checkInvariants();

	// Later ticks fail the same way without losing or duplicating anything
	CHECK_THROWS_MATCHES(fx.streamer.tick(), Exception, test::errcExceptionMatcher(TileStreamErrc::UnknownError));
	CHECK(fx.streamer.pendingCount() == 4);
	CHECK(fx.generator->callCount() == 0);
}

} // namespace tilestream::stream
