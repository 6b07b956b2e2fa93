#pragma once

#include <tilestream/visibility.hpp>
#include <tilestream/world/chunk_data.hpp>

#include <glm/vec2.hpp>

namespace tilestream::stream
{

struct Viewport {
	// World pixel position of the viewport center
	glm::dvec2 center { 0.0, 0.0 };
	// Viewport size in screen pixels
	glm::dvec2 size { 0.0, 0.0 };
	// Screen pixels per world pixel, must be positive
	double zoom = 1.0;
};

// Polled once at the beginning of every `ChunkStreamer::tick()`
class TILESTREAM_API IViewportProvider {
public:
	virtual ~IViewportProvider() = default;

	virtual Viewport viewport() const = 0;
};

// Receives generated chunks. Called only from the thread calling `tick()`.
class TILESTREAM_API IChunkRenderer {
public:
	virtual ~IChunkRenderer() = default;

	// Takes ownership of the data. A chunk can be presented again
	// (with possibly different contents) after `invalidateAll()`.
	virtual void presentChunk(world::ChunkData &&data) = 0;
};

} // namespace tilestream::stream
