#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <opencv2/opencv.hpp>

#include "camera.h"
#include "json_loader.h"
#include "pixel_buffer.h"
#include "renderer.h"
#include "scene.h"

/**
 * @brief Wrap an RGB pixel buffer into an 8-bit BGR OpenCV image.
 * @param pixels Row-major, top-row-first RGB buffer.
 * @return cv::Mat with type CV_8UC3 in BGR channel order.
 */
static cv::Mat pixels_to_mat_bgr8(const PixelBuffer& pixels) {
    const int W = pixels.width();
    const int H = pixels.height();
    cv::Mat img(H, W, CV_8UC3);
    for (int y = 0; y < H; ++y) {
        auto* p = img.ptr<cv::Vec3b>(y);
        for (int x = 0; x < W; ++x) {
            p[x] = cv::Vec3b{ pixels.at(x, y, 2), pixels.at(x, y, 1), pixels.at(x, y, 0) };
        }
    }
    return img;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <scene.json> <output.png> [--workers N] [--seed S] [--verbose]\n";
    std::cerr << "  --workers N: number of parallel render workers (default: hardware threads)\n";
    std::cerr << "  --seed S:    base random seed (default: 1337)\n";
    std::cerr << "  --verbose:   print per-worker statistics\n";
}

/**
 * @brief Program entry: load scene JSON, render on parallel workers, and write PNG.
 * @param argc Argument count.
 * @param argv Arguments: <scene.json> <output.png> [options].
 * @return Exit code: 0 on success; 1 usage, 2 load, 3 render, 4 I/O errors.
 */
int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string json_path = argv[1];
    const std::string out_path  = argv[2];

    RenderOptions options;
    const unsigned hw = std::thread::hardware_concurrency();
    options.worker_count = hw > 0 ? static_cast<int>(hw) : 1;

    try {
        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--workers" && i + 1 < argc) {
                options.worker_count = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                options.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--verbose") {
                options.verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[error] bad option value: " << e.what() << "\n";
        return 1;
    }
    if (options.worker_count < 1) {
        std::cerr << "[error] --workers must be >= 1\n";
        return 1;
    }

    Scene scene;
    try {
        jsonio::load_scene_from_json(json_path, scene);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 2;
    }

    const Camera camera(scene.camera);
    std::cout << "Rendering " << camera.width() << "x" << camera.height()
              << " with " << camera.config().samples_per_pixel << " spp, depth "
              << camera.config().max_depth << ", " << scene.world->size() << " objects on "
              << options.worker_count << " worker(s)\n";

    RenderResult result;
    try {
        result = render(*scene.world, camera, options);
    } catch (const RenderError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[error] render failed: " << e.what() << "\n";
        return 3;
    }

    cv::Mat img = pixels_to_mat_bgr8(result.pixels);
    if (!cv::imwrite(out_path, img)) {
        std::cerr << "Failed to write PNG: " << out_path << "\n";
        return 4;
    }

    std::cout << "Wrote " << out_path << " (" << camera.width() << "x" << camera.height() << ") in "
              << result.wall_ms << " ms | " << result.stats.rays_traced << " rays, "
              << result.stats.samples_taken << " samples\n";
    return 0;
}
