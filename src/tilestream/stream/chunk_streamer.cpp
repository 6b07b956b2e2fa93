#include <tilestream/stream/chunk_streamer.hpp>

#include <tilestream/common/thread_pool.hpp>
#include <tilestream/stream/visibility_planner.hpp>
#include <tilestream/util/error_condition.hpp>
#include <tilestream/util/exception.hpp>
#include <tilestream/util/log.hpp>

#include <cmath>
#include <exception>
#include <vector>

namespace tilestream::stream
{

namespace
{

// Runs on a worker thread, must not touch any streamer state
GenerationResult runGeneration(const world::IChunkGenerator &generator, world::ChunkCoord coord,
	int32_t chunk_size) noexcept
{
	try {
		return generator.generate(coord, chunk_size);
	}
	catch (const Exception &ex) {
		Log::warn("Chunk ({}, {}) generation failed: {}", coord.x, coord.y, ex.what());
		return cpp::failure(ex.error());
	}
	catch (const std::exception &ex) {
		Log::warn("Chunk ({}, {}) generation failed: {}", coord.x, coord.y, ex.what());
		return cpp::failure(make_error_condition(TileStreamErrc::GenerationFailure));
	}
	catch (...) {
		Log::warn("Chunk ({}, {}) generation failed with unknown exception", coord.x, coord.y);
		return cpp::failure(make_error_condition(TileStreamErrc::UnknownError));
	}
}

StreamSettings validated(StreamSettings settings)
{
	settings.validate();
	return settings;
}

bool isUsableViewport(const Viewport &vp) noexcept
{
	return vp.zoom > 0.0 && std::isfinite(vp.zoom) && std::isfinite(vp.center.x) && std::isfinite(vp.center.y)
		&& std::isfinite(vp.size.x) && std::isfinite(vp.size.y) && vp.size.x >= 0.0 && vp.size.y >= 0.0;
}

} // namespace

ChunkStreamer::ChunkStreamer(StreamSettings settings, ThreadPool &pool, IViewportProvider &viewport,
	IChunkRenderer &renderer, std::shared_ptr<const world::IChunkGenerator> generator)
	: m_settings(validated(std::move(settings)))
	, m_mapper(m_settings.tile_size, m_settings.chunk_size)
	, m_pool(pool)
	, m_viewport(viewport)
	, m_renderer(renderer)
	, m_generator(std::move(generator))
	, m_completed(std::make_shared<CompletionChannel<GeneratedChunk>>())
	, m_failed(std::make_shared<CompletionChannel<FailedChunk>>())
{
	if (!m_generator) {
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "chunk generator is not set");
	}

	Log::info("Chunk streamer started: chunk {}x{} tiles, tile {} px, buffer {}, K = {}, A = {}",
		m_settings.chunk_size, m_settings.chunk_size, m_settings.tile_size, m_settings.buffer,
		m_settings.max_concurrent, m_settings.apply_per_tick);
}

ChunkStreamer::~ChunkStreamer() noexcept
{
	if (!m_generating.empty()) {
		Log::debug("Chunk streamer destroyed with {} chunks in flight", m_generating.size());
	}
}

void ChunkStreamer::tick()
{
	++m_tick;
	m_stats = {};

	admitVisible();
	dispatchPending();
	applyCompleted();
	processFailures();
	expireTimedOut();

	if (m_stats.admitted + m_stats.dispatched + m_stats.applied + m_stats.failed > 0) {
		Log::trace("Tick {}: admitted {}, dispatched {}, applied {}, failed {}, discarded {}", m_tick.value,
			m_stats.admitted, m_stats.dispatched, m_stats.applied, m_stats.failed, m_stats.discarded);
	}
}

void ChunkStreamer::invalidateAll()
{
	m_pending.clear();
	m_queued.clear();
	m_generating.clear();
	m_generated.clear();
	m_abandoned.clear();
	m_failures.clear();
	m_epoch++;

	Log::info("All chunks invalidated, epoch is now {}", m_epoch);
}

void ChunkStreamer::setGenerator(std::shared_ptr<const world::IChunkGenerator> generator)
{
	if (!generator) {
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "chunk generator is not set");
	}

	m_generator = std::move(generator);
	invalidateAll();
}

void ChunkStreamer::reconfigure(StreamSettings settings, std::shared_ptr<const world::IChunkGenerator> generator)
{
	settings.validate();
	if (!generator) {
		throw Exception::fromError(TileStreamErrc::InvalidConfig, "chunk generator is not set");
	}

	const bool invalidate = generator != m_generator || settings.affectsGeneration(m_settings);

	m_settings = std::move(settings);
	m_mapper = world::CoordMapper(m_settings.tile_size, m_settings.chunk_size);
	m_generator = std::move(generator);

	Log::info("Chunk streamer reconfigured");
	if (invalidate) {
		invalidateAll();
	}
}

ChunkState ChunkStreamer::stateOf(world::ChunkCoord coord) const noexcept
{
	if (m_generated.contains(coord)) {
		return ChunkState::Generated;
	}
	if (m_generating.contains(coord)) {
		return ChunkState::Generating;
	}
	if (m_queued.contains(coord)) {
		return ChunkState::Queued;
	}
	if (m_abandoned.contains(coord)) {
		return ChunkState::Abandoned;
	}
	return ChunkState::Unseen;
}

uint32_t ChunkStreamer::failureCount(world::ChunkCoord coord) const noexcept
{
	auto iter = m_failures.find(coord);
	return iter != m_failures.end() ? iter->second : 0;
}

void ChunkStreamer::admitVisible()
{
	const Viewport vp = m_viewport.viewport();
	if (!isUsableViewport(vp)) [[unlikely]] {
		Log::warn("Unusable viewport (center ({}, {}), size ({}, {}), zoom {}), skipping admission", vp.center.x,
			vp.center.y, vp.size.x, vp.size.y, vp.zoom);
		return;
	}

	const ChunkRect rect = VisibilityPlanner::visibleChunkRect(vp, m_mapper, m_settings.buffer);
	if (rect.area() > MAX_ADMISSION_AREA) [[unlikely]] {
		Log::warn("Visible area of {}x{} chunks exceeds the limit of {}, skipping admission", rect.width(),
			rect.height(), MAX_ADMISSION_AREA);
		return;
	}

	const world::ChunkCoord center = m_mapper.worldToChunk(vp.center);

	// Chunks beyond the tile coordinate range can't be generated, never admit them
	auto admission = VisibilityPlanner::admissionOrder(rect, center, [this](world::ChunkCoord coord) {
		return m_mapper.isChunkInRange(coord) && stateOf(coord) == ChunkState::Unseen;
	});

	for (world::ChunkCoord coord : admission) {
		m_queued.insert(coord);
		m_pending.push_back(coord);
		Log::trace("Admitted chunk ({}, {})", coord.x, coord.y);
	}

	m_stats.admitted = uint32_t(admission.size());
}

void ChunkStreamer::dispatchPending()
{
	while (m_generating.size() < size_t(m_settings.max_concurrent) && !m_pending.empty()) {
		const world::ChunkCoord coord = m_pending.front();
		const uint64_t ticket = m_next_ticket + 1;

		// Captured by value, the task must not reference the streamer
		auto task = [generator = m_generator, completed = m_completed, failed = m_failed, coord, ticket,
						epoch = m_epoch, chunk_size = m_settings.chunk_size]() {
			GenerationResult result = runGeneration(*generator, coord, chunk_size);
			if (result) {
				completed->push(GeneratedChunk {
					.coord = coord,
					.epoch = epoch,
					.ticket = ticket,
					.data = std::move(result).value(),
				});
			} else {
				failed->push(FailedChunk { .coord = coord, .epoch = epoch, .ticket = ticket, .error = result.error() });
			}
		};

		// Results come back through the channels, the future is not needed.
		// Scheduler state changes only after a successful enqueue, a throw leaves `coord` pending.
		[[maybe_unused]] auto future = m_pool.enqueueTask(std::move(task));

		m_next_ticket = ticket;
		m_pending.pop_front();
		m_queued.erase(coord);
		m_generating[coord] = InFlight { .ticket = ticket, .dispatched_tick = m_tick };

		m_stats.dispatched++;
		Log::debug("Dispatched chunk ({}, {}), ticket {}", coord.x, coord.y, ticket);
	}
}

void ChunkStreamer::applyCompleted()
{
	for (int32_t i = 0; i < m_settings.apply_per_tick; i++) {
		std::optional<GeneratedChunk> entry = m_completed->tryPop();
		if (!entry) {
			break;
		}

		const world::ChunkCoord coord = entry->coord;
		if (!isCurrent(coord, entry->epoch, entry->ticket)) {
			// Still counts toward the per-tick limit
			Log::debug("Discarding stale chunk ({}, {}) (epoch {}, ticket {})", coord.x, coord.y, entry->epoch,
				entry->ticket);
			m_stats.discarded++;
			continue;
		}

		m_generating.erase(coord);
		m_generated.insert(coord);
		m_failures.erase(coord);
		m_stats.applied++;

		Log::debug("Applying chunk ({}, {})", coord.x, coord.y);
		m_renderer.presentChunk(std::move(entry->data));
	}
}

void ChunkStreamer::processFailures()
{
	while (std::optional<FailedChunk> entry = m_failed->tryPop()) {
		if (!isCurrent(entry->coord, entry->epoch, entry->ticket)) {
			m_stats.discarded++;
			continue;
		}

		handleFailure(entry->coord, entry->error);
	}
}

void ChunkStreamer::expireTimedOut()
{
	const int32_t timeout = m_settings.generation_timeout_ticks;
	if (timeout <= 0) {
		return;
	}

	std::vector<world::ChunkCoord> expired;
	for (const auto &[coord, in_flight] : m_generating) {
		if (m_tick - in_flight.dispatched_tick > timeout) {
			expired.push_back(coord);
		}
	}

	for (world::ChunkCoord coord : expired) {
		Log::warn("Chunk ({}, {}) generation timed out after {} ticks", coord.x, coord.y, timeout);
		m_stats.timed_out++;
		// Its ticket is forgotten here, so a late result will be discarded
		handleFailure(coord, make_error_condition(TileStreamErrc::GenerationTimeout));
	}
}

void ChunkStreamer::handleFailure(world::ChunkCoord coord, std::error_condition error)
{
	m_generating.erase(coord);
	m_stats.failed++;

	const uint32_t failures = ++m_failures[coord];
	Log::warn("Chunk ({}, {}) failed (attempt {}): {}", coord.x, coord.y, failures, error.message());

	if (m_settings.max_retries > 0 && failures > uint32_t(m_settings.max_retries)) {
		Log::error("Chunk ({}, {}) abandoned after {} failures", coord.x, coord.y, failures);
		m_failures.erase(coord);
		m_abandoned.insert(coord);
		m_stats.abandoned++;
		return;
	}

	if (m_generated.contains(coord) || m_queued.contains(coord)) {
		return;
	}

	m_queued.insert(coord);
	m_pending.push_back(coord);
}

bool ChunkStreamer::isCurrent(world::ChunkCoord coord, uint64_t epoch, uint64_t ticket) const noexcept
{
	if (epoch != m_epoch) {
		return false;
	}

	auto iter = m_generating.find(coord);
	return iter != m_generating.end() && iter->second.ticket == ticket;
}

} // namespace tilestream::stream

namespace extras
{

using tilestream::stream::ChunkState;

template<>
std::string_view enum_name(ChunkState value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case ChunkState::Unseen:
		return "Unseen"sv;
	case ChunkState::Queued:
		return "Queued"sv;
	case ChunkState::Generating:
		return "Generating"sv;
	case ChunkState::Generated:
		return "Generated"sv;
	case ChunkState::Abandoned:
		return "Abandoned"sv;
	}

	return "Unknown"sv;
}

} // namespace extras
