#include "tracer.h"
#include "material.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

Color Tracer::trace_recursive(const Ray& r, int depth, Rng& rng, RenderStats& stats) const {
    // Stop condition
    if (depth > camera->config().max_depth) return Color(0,0,0);

    ++stats.rays_traced;

    Hit h;
    if (!world->intersect(r, Interval(kRayEpsilon, kINF), h)) {
        return camera->config().background.sample(r.d);
    }
    if (!h.mat) return Color(0,0,0);

    const Color emission = h.mat->emitted(h);

    ScatterRecord rec;
    if (!h.mat->scatter(r, h, rng, rec)) return emission;

    return emission + hadamard(rec.attenuation, trace_recursive(rec.scattered, depth + 1, rng, stats));
}

Color Tracer::sample_pixel(int i, int j, Rng& rng, RenderStats& stats) const {
    const CameraConfig& cfg = camera->config();
    const int spp = cfg.samples_per_pixel;
    const bool adaptive = cfg.adaptive_tolerance > 0.0 && spp > 1;

    Color acc{0,0,0};
    int taken = 0;
    double s1 = 0.0, s2 = 0.0;   // illuminance sums

    while (taken < spp) {
        const int batch = adaptive ? std::min(cfg.adaptive_batch, spp - taken) : spp - taken;
        for (int s = 0; s < batch; ++s) {
            const Color c = trace(camera->get_ray(i, j, rng), rng, stats);
            acc += c;
            if (adaptive) {
                const double ill = c.illuminance();
                s1 += ill;
                s2 += ill * ill;
            }
            ++taken;
        }
        if (!adaptive || taken >= spp || taken < 2) continue;

        const double mean = s1 / taken;
        const double variance = (s2 - (s1 * s1) / taken) / (taken - 1);
        if (!(variance > 0.0)) break;  // constant radiance or numeric trouble
        const double half_width = 1.96 * std::sqrt(variance) / std::sqrt(double(taken));
        if (half_width <= cfg.adaptive_tolerance * mean) break;
    }

    stats.samples_taken += taken;
    return acc * (1.0 / double(taken));
}

RenderStats Tracer::render_region(PixelWindow& window, Rng& rng) const {
    if (!world || !camera) throw std::logic_error("Tracer needs a world and a camera");

    RenderStats stats;
    const auto start = std::chrono::steady_clock::now();

    const Region& reg = window.region();
    for (int y = reg.y; y < reg.y + reg.height; ++y) {
        for (int x = reg.x; x < reg.x + reg.width; ++x) {
            window.write_color(x, y, sample_pixel(x, y, rng, stats));
            ++stats.pixels_rendered;
        }
    }

    const auto end = std::chrono::steady_clock::now();
    stats.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return stats;
}

RenderStats Tracer::render_region(PixelBuffer& buffer, int start_x, int start_y,
                                  int width, int height, Rng& rng) const {
    PixelWindow window = buffer.window(Region{start_x, start_y, width, height});
    return render_region(window, rng);
}
