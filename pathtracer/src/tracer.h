#pragma once
#include <algorithm>
#include <cstdint>
#include "camera.h"
#include "geometry.h"
#include "pixel_buffer.h"
#include "rng.h"

/// RenderStats: counters for one worker, or the merge of several.
struct RenderStats {
    /// Rays cast (primary and scattered).
    std::int64_t rays_traced{0};
    /// Pixels written.
    std::int64_t pixels_rendered{0};
    /// Camera samples evaluated.
    std::int64_t samples_taken{0};
    /// Wall-clock duration in milliseconds.
    double       elapsed_ms{0.0};

    /// Sum counters; keep the longest duration (workers run side by side).
    RenderStats& merge(const RenderStats& other) {
        rays_traced     += other.rays_traced;
        pixels_rendered += other.pixels_rendered;
        samples_taken   += other.samples_taken;
        elapsed_ms       = std::max(elapsed_ms, other.elapsed_ms);
        return *this;
    }
};

/**
 * @brief Monte Carlo path integrator for a world and a camera.
 * Owns nothing; both must outlive the tracer and stay unmodified while rendering.
 * All mutable state (rng, stats) belongs to the caller, so one Tracer can be
 * shared by concurrent workers.
 */
struct Tracer {
    /// Scene root (non-owning).
    const Primitive* world{nullptr};
    /// Camera providing ray generation and sampling settings (non-owning).
    const Camera*    camera{nullptr};

    /// Lower bound of valid hit distances; avoids self-intersection.
    static constexpr double kRayEpsilon = 1e-3;

    Tracer() = default;
    Tracer(const Primitive& w, const Camera& c) : world(&w), camera(&c) {}

    /**
     * @brief Evaluate radiance recursively.
     * @param r Input ray.
     * @param depth Scatter events already taken on this path (0 for camera rays).
     * @param rng Worker-owned random source.
     * @param stats Ray counter sink.
     * @return Linear RGB radiance; black once depth exceeds max_depth.
     */
    Color trace_recursive(const Ray& r, int depth, Rng& rng, RenderStats& stats) const;

    /// Trace a camera ray.
    Color trace(const Ray& r, Rng& rng, RenderStats& stats) const {
        return trace_recursive(r, 0, rng, stats);
    }

    /**
     * @brief Average radiance over the pixel's samples (adaptive if configured).
     * @param i Pixel column.
     * @param j Pixel row.
     * @param rng Worker-owned random source.
     * @param stats Counter sink.
     * @return Mean linear radiance.
     */
    Color sample_pixel(int i, int j, Rng& rng, RenderStats& stats) const;

    /**
     * @brief Render every pixel of the window's region.
     * @param window Write view onto the shared buffer.
     * @param rng Worker-owned random source.
     * @return Stats for this region; throws std::logic_error if world/camera are unset.
     */
    RenderStats render_region(PixelWindow& window, Rng& rng) const;

    /// Convenience form taking the sub-rectangle explicitly.
    RenderStats render_region(PixelBuffer& buffer, int start_x, int start_y,
                              int width, int height, Rng& rng) const;
};
