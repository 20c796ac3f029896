#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "camera.h"
#include "geometry.h"
#include "pixel_buffer.h"
#include "tracer.h"

/// RenderOptions: how a render is split across workers.
struct RenderOptions {
    /// Number of concurrent workers (>= 1; clamped to the pixel count).
    int           worker_count{1};
    /// Base seed; worker k draws from stream (seed, k).
    std::uint32_t seed{1337};
    /// Print per-worker summaries to std::cerr.
    bool          verbose{false};
};

/// WorkerReport: what one worker rendered and how long it took.
struct WorkerReport {
    int         worker_id{0};
    Region      region;
    RenderStats stats;
};

/// WorkerFailure: a worker that stopped before finishing its region (id -1: buffer setup).
struct WorkerFailure {
    int         worker_id{0};
    Region      region;
    std::string cause;
};

/// RenderError: one or more workers failed; the image is not returned.
class RenderError : public std::runtime_error {
public:
    explicit RenderError(std::vector<WorkerFailure> failures);

    const std::vector<WorkerFailure>& failures() const { return failures_; }

private:
    std::vector<WorkerFailure> failures_;
};

/// RenderResult: completed image plus statistics.
struct RenderResult {
    PixelBuffer               pixels;
    /// Merge of all worker stats.
    RenderStats               stats;
    /// One entry per worker, ordered by worker id.
    std::vector<WorkerReport> workers;
    /// Coordinator wall-clock time in milliseconds.
    double                    wall_ms{0.0};
};

/**
 * @brief Split a width×height image into exactly @p count disjoint regions covering it.
 * Uses min(count, height) horizontal strips; each strip is divided into columns so
 * that the regions are spread as evenly as possible.
 * @param width Image width (> 0).
 * @param height Image height (> 0).
 * @param count Number of regions in [1, width*height].
 * @return Regions in row-major order; throws std::invalid_argument on bad input.
 */
std::vector<Region> partition_image(int width, int height, int count);

/**
 * @brief Render @p world through @p camera on parallel workers.
 * Each worker renders one region straight into the shared buffer. The coordinator
 * waits for every worker and throws RenderError if any of them failed, could not be
 * launched, or if the buffer could not be allocated.
 * @param world Read-only scene root shared by all workers.
 * @param camera Read-only camera shared by all workers.
 * @param options Worker count, seed, verbosity.
 * @return Image and aggregated statistics.
 */
RenderResult render(const Primitive& world, const Camera& camera, const RenderOptions& options);
