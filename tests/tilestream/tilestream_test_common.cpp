#include "../tilestream_test_common.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <thread>

namespace tilestream::test
{

bool waitUntil(const std::function<bool()> &pred, std::chrono::milliseconds timeout)
{
	const auto deadline = std::chrono::steady_clock::now() + timeout;

	while (!pred()) {
		if (std::chrono::steady_clock::now() > deadline) {
			return pred();
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}

	return true;
}

std::vector<world::ChunkCoord> RecordingRenderer::coords() const
{
	std::vector<world::ChunkCoord> result;
	for (const world::ChunkData &data : presented) {
		result.push_back(data.coord());
	}
	return result;
}

ScriptedGenerator::~ScriptedGenerator()
{
	// Don't leave blocked workers behind
	openGate();
}

world::ChunkData ScriptedGenerator::generate(world::ChunkCoord coord, int32_t chunk_size) const
{
	m_calls.fetch_add(1);

	uint32_t in_flight = m_in_flight.fetch_add(1) + 1;
	uint32_t prev_max = m_max_in_flight.load();
	while (prev_max < in_flight && !m_max_in_flight.compare_exchange_weak(prev_max, in_flight)) {}

	m_waiting.fetch_add(1);
	while (!m_gate_open.load()) {
		std::this_thread::sleep_for(std::chrono::microseconds(200));
	}
	m_waiting.fetch_sub(1);

	bool fail = false;
	{
		std::lock_guard lock(m_fail_lock);
		auto iter = std::find_if(m_failures.begin(), m_failures.end(), [coord](const auto &p) { return p.first == coord; });
		if (iter != m_failures.end() && iter->second > 0) {
			fail = true;
			if (iter->second != UINT32_MAX) {
				iter->second--;
			}
		}
	}

	m_in_flight.fetch_sub(1);

	if (fail) {
		throw Exception::fromError(TileStreamErrc::GenerationFailure, "scripted failure");
	}

	return world::ChunkData(coord, glm::ivec2(coord.x * chunk_size, coord.y * chunk_size), chunk_size);
}

void ScriptedGenerator::failCoord(world::ChunkCoord coord, uint32_t times)
{
	std::lock_guard lock(m_fail_lock);
	m_failures.emplace_back(coord, times);
}

} // namespace tilestream::test

namespace Catch
{

std::string StringMaker<tilestream::world::ChunkCoord>::convert(tilestream::world::ChunkCoord coord)
{
	return fmt::format("({}, {})", coord.x, coord.y);
}

} // namespace Catch
