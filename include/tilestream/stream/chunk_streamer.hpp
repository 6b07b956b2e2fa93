#pragma once

#include <tilestream/stream/completion_channel.hpp>
#include <tilestream/stream/stream_interfaces.hpp>
#include <tilestream/stream/stream_settings.hpp>
#include <tilestream/util/tagged_tick_id.hpp>
#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_generator.hpp>
#include <tilestream/world/coord_mapper.hpp>

#include <extras/enum_utils.hpp>

#include <cpp/result.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

namespace tilestream
{

class ThreadPool;

}

namespace tilestream::stream
{

enum class ChunkState {
	// Not tracked, will be admitted when it becomes visible
	Unseen,
	// Admitted and waiting in the pending queue
	Queued,
	// Dispatched to a worker
	Generating,
	// Applied and handed to the renderer
	Generated,
	// Failed more times than allowed, not admitted until `invalidateAll()`
	Abandoned,
};

using GenerationResult = cpp::result<world::ChunkData, std::error_condition>;

// Deposited by a worker when generation succeeds
struct GeneratedChunk {
	world::ChunkCoord coord;
	uint64_t epoch = 0;
	uint64_t ticket = 0;
	world::ChunkData data;
};

// Deposited by a worker when generation fails
struct FailedChunk {
	world::ChunkCoord coord;
	uint64_t epoch = 0;
	uint64_t ticket = 0;
	std::error_condition error;
};

// What the last `tick()` did, for diagnostics and tests
struct StreamTickStats {
	// Coordinates newly admitted from the visible area
	uint32_t admitted = 0;
	// Tasks sent to the worker pool
	uint32_t dispatched = 0;
	// Chunks handed to the renderer
	uint32_t applied = 0;
	// Completions or failures dropped because of a stale epoch or ticket
	uint32_t discarded = 0;
	// Failures (including timeouts) processed by the retry path
	uint32_t failed = 0;
	uint32_t timed_out = 0;
	// Coordinates moved to `Abandoned`
	uint32_t abandoned = 0;
};

// Decides which chunks around the viewport get generated, runs generation
// on the worker pool with bounded concurrency and applies completed chunks
// to the renderer at a bounded rate.
//
// Each `tick()` runs these steps in order:
// 1. Poll the viewport and admit every unseen chunk of the visible (plus buffer)
//    rectangle into the pending queue, nearest to the viewport center first.
// 2. Dispatch pending chunks while fewer than `max_concurrent` are generating.
// 3. Apply at most `apply_per_tick` completions in arrival order.
// 4. Drain all failures (and expire timed out dispatches), re-queueing
//    failed chunks or abandoning ones that exceeded `max_retries`.
//
// Every dispatch carries the current epoch and a unique ticket. Results whose
// epoch was bumped by `invalidateAll()` or whose ticket no longer matches the
// tracked dispatch (timed out) are discarded on arrival.
//
// All methods must be called from a single thread. Worker tasks only touch
// the shared channels and the generator snapshot they captured, so they can
// safely outlive the streamer.
class TILESTREAM_API ChunkStreamer {
public:
	// Admission is skipped (with a warning) for a tick whose visible
	// rectangle, buffer included, has more chunks than this
	constexpr static int64_t MAX_ADMISSION_AREA = 1 << 16;

	// Throws `Exception` with `InvalidConfig` if `settings` are invalid or `generator` is null
	ChunkStreamer(StreamSettings settings, ThreadPool &pool, IViewportProvider &viewport, IChunkRenderer &renderer,
		std::shared_ptr<const world::IChunkGenerator> generator);
	ChunkStreamer(ChunkStreamer &&) = delete;
	ChunkStreamer(const ChunkStreamer &) = delete;
	ChunkStreamer &operator=(ChunkStreamer &&) = delete;
	ChunkStreamer &operator=(const ChunkStreamer &) = delete;
	~ChunkStreamer() noexcept;

	// Exceptions from the thread pool (e.g. a stopped pool) propagate,
	// the coordinate that failed to dispatch stays pending
	void tick();

	// Forget every tracked chunk and bump the epoch.
	// In-flight tasks keep running, their results will be discarded.
	void invalidateAll();

	// Replace the generator and invalidate everything. Throws `Exception` if `generator` is null.
	void setGenerator(std::shared_ptr<const world::IChunkGenerator> generator);
	// Replace settings and generator. Invalidates everything if the generator
	// changed or `settings` differ in generation-affecting fields.
	// Throws `Exception` (leaving the streamer unchanged) on invalid input.
	void reconfigure(StreamSettings settings, std::shared_ptr<const world::IChunkGenerator> generator);

	bool isGenerated(world::ChunkCoord coord) const noexcept { return m_generated.contains(coord); }
	// Raw set membership, a coordinate is in at most one of these sets.
	// `stateOf()` is the summary of them.
	bool isQueued(world::ChunkCoord coord) const noexcept { return m_queued.contains(coord); }
	bool isGenerating(world::ChunkCoord coord) const noexcept { return m_generating.contains(coord); }
	bool isAbandoned(world::ChunkCoord coord) const noexcept { return m_abandoned.contains(coord); }
	ChunkState stateOf(world::ChunkCoord coord) const noexcept;

	// Chunks admitted but not dispatched yet
	size_t pendingCount() const noexcept { return m_pending.size(); }
	size_t queuedCount() const noexcept { return m_queued.size(); }
	size_t generatingCount() const noexcept { return m_generating.size(); }
	size_t generatedCount() const noexcept { return m_generated.size(); }
	size_t abandonedCount() const noexcept { return m_abandoned.size(); }
	// Results deposited by workers but not drained yet (approximate)
	size_t completedBacklog() const noexcept { return m_completed->sizeApprox(); }
	size_t failedBacklog() const noexcept { return m_failed->sizeApprox(); }
	// Failures recorded for `coord` since it was last generated or invalidated
	uint32_t failureCount(world::ChunkCoord coord) const noexcept;

	uint64_t epoch() const noexcept { return m_epoch; }
	StreamTickId currentTick() const noexcept { return m_tick; }
	const StreamSettings &settings() const noexcept { return m_settings; }
	const world::CoordMapper &coordMapper() const noexcept { return m_mapper; }
	const StreamTickStats &lastTickStats() const noexcept { return m_stats; }

private:
	struct InFlight {
		uint64_t ticket = 0;
		StreamTickId dispatched_tick;
	};

	void admitVisible();
	void dispatchPending();
	void applyCompleted();
	void processFailures();
	void expireTimedOut();
	void handleFailure(world::ChunkCoord coord, std::error_condition error);

	// True if the result belongs to the currently tracked dispatch of `coord`
	bool isCurrent(world::ChunkCoord coord, uint64_t epoch, uint64_t ticket) const noexcept;

	StreamSettings m_settings;
	world::CoordMapper m_mapper;
	ThreadPool &m_pool;
	IViewportProvider &m_viewport;
	IChunkRenderer &m_renderer;
	std::shared_ptr<const world::IChunkGenerator> m_generator;

	std::shared_ptr<CompletionChannel<GeneratedChunk>> m_completed;
	std::shared_ptr<CompletionChannel<FailedChunk>> m_failed;

	std::deque<world::ChunkCoord> m_pending;
	std::unordered_set<world::ChunkCoord> m_queued;
	std::unordered_map<world::ChunkCoord, InFlight> m_generating;
	std::unordered_set<world::ChunkCoord> m_generated;
	std::unordered_set<world::ChunkCoord> m_abandoned;
	std::unordered_map<world::ChunkCoord, uint32_t> m_failures;

	uint64_t m_epoch = 0;
	uint64_t m_next_ticket = 0;
	StreamTickId m_tick { 0 };
	StreamTickStats m_stats;
};

} // namespace tilestream::stream

namespace extras
{

template<>
std::string_view enum_name(tilestream::stream::ChunkState value) noexcept;

}
