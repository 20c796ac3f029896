#include "renderer.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <utility>

namespace {

std::string describe(const std::vector<WorkerFailure>& failures) {
    std::ostringstream os;
    os << failures.size() << " render worker(s) failed";
    for (const auto& f : failures) {
        os << "; worker " << f.worker_id << " region (" << f.region.x << "," << f.region.y
           << " " << f.region.width << "x" << f.region.height << "): " << f.cause;
    }
    return os.str();
}

} // namespace

RenderError::RenderError(std::vector<WorkerFailure> failures)
: std::runtime_error(describe(failures)), failures_(std::move(failures)) {}

std::vector<Region> partition_image(int width, int height, int count) {
    if (width <= 0 || height <= 0) throw std::invalid_argument("Image size must be positive");
    if (count < 1) throw std::invalid_argument("Region count must be >= 1");
    if (static_cast<long long>(count) > static_cast<long long>(width) * height)
        throw std::invalid_argument("Region count exceeds pixel count");

    const int strips = std::min(count, height);
    std::vector<Region> regions;
    regions.reserve(count);

    for (int s = 0; s < strips; ++s) {
        // rows [y0, y1) for strip s
        const int y0 = static_cast<int>(static_cast<long long>(height) * s / strips);
        const int y1 = static_cast<int>(static_cast<long long>(height) * (s + 1) / strips);
        // workers for strip s; count/strips or one more, never above width
        const int cols = count / strips + (s < count % strips ? 1 : 0);

        for (int c = 0; c < cols; ++c) {
            const int x0 = static_cast<int>(static_cast<long long>(width) * c / cols);
            const int x1 = static_cast<int>(static_cast<long long>(width) * (c + 1) / cols);
            regions.push_back(Region{x0, y0, x1 - x0, y1 - y0});
        }
    }
    return regions;
}

RenderResult render(const Primitive& world, const Camera& camera, const RenderOptions& options) {
    if (options.worker_count < 1) throw std::invalid_argument("worker_count must be >= 1");

    const int W = camera.width();
    const int H = camera.height();
    const long long pixels = static_cast<long long>(W) * H;
    const int workers = static_cast<int>(std::min<long long>(options.worker_count, pixels));

    RenderResult result;
    try {
        result.pixels = PixelBuffer(W, H);
    } catch (const std::exception& e) {
        // no worker started; report against the whole image
        throw RenderError(std::vector<WorkerFailure>{WorkerFailure{-1, Region{0, 0, W, H}, e.what()}});
    }

    const std::vector<Region> regions = partition_image(W, H, workers);
    const Tracer tracer(world, camera);

    const auto start = std::chrono::steady_clock::now();

    // Each task owns its window and rng; the scene is shared read-only.
    std::vector<std::future<RenderStats>> tasks;
    std::vector<WorkerFailure> failures;
    tasks.reserve(regions.size());
    for (std::size_t k = 0; k < regions.size(); ++k) {
        try {
            PixelWindow window = result.pixels.window(regions[k]);
            const std::uint32_t stream = static_cast<std::uint32_t>(k);
            tasks.push_back(std::async(std::launch::async,
                [&tracer, window, seed = options.seed, stream]() mutable {
                    Rng rng(seed, stream);
                    return tracer.render_region(window, rng);
                }));
        } catch (const std::exception& e) {
            // thread creation failed; stop launching and let the started workers finish
            failures.push_back(WorkerFailure{static_cast<int>(k), regions[k],
                                             std::string("launch failed: ") + e.what()});
            break;
        }
    }

    for (std::size_t k = 0; k < tasks.size(); ++k) {
        try {
            RenderStats s = tasks[k].get();
            result.stats.merge(s);
            result.workers.push_back(WorkerReport{static_cast<int>(k), regions[k], s});
        } catch (const std::exception& e) {
            failures.push_back(WorkerFailure{static_cast<int>(k), regions[k], e.what()});
        }
    }

    const auto end = std::chrono::steady_clock::now();
    result.wall_ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (options.verbose) {
        for (const auto& w : result.workers) {
            std::cerr << "[worker " << w.worker_id << "] region " << w.region.x << "," << w.region.y
                      << " " << w.region.width << "x" << w.region.height
                      << " | " << w.stats.rays_traced << " rays, "
                      << w.stats.pixels_rendered << " px, " << w.stats.elapsed_ms << " ms\n";
        }
        for (const auto& f : failures) {
            std::cerr << "[error] worker " << f.worker_id << " failed: " << f.cause << "\n";
        }
    }

    if (!failures.empty()) throw RenderError(std::move(failures));
    return result;
}
