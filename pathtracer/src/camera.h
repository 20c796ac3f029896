#pragma once
#include "core.h"
#include "rng.h"

/// Background: radiance returned for rays that escape the scene.
struct Background {
    /// Gradient between bottom and top; Black returns zero radiance.
    enum class Kind { Gradient, Black };

    Kind  kind{Kind::Gradient};
    /// Color for rays pointing straight up.
    Color top{0.5, 0.7, 1.0};
    /// Color for rays pointing straight down.
    Color bottom{1.0, 1.0, 1.0};

    /// Radiance seen along direction @p dir.
    Color sample(const Vec3& dir) const {
        if (kind == Kind::Black) return Color(0, 0, 0);
        const double a = 0.5 * (dir.normalized().y + 1.0);
        return lerp(bottom, top, a);
    }
};

/**
 * @brief Camera and sampling settings for one render.
 * A non-positive focus_dist means "focus on look_at".
 */
struct CameraConfig {
    /// Output width in pixels.
    int    image_width{400};
    /// Output height in pixels.
    int    image_height{225};
    /// Vertical field of view in degrees.
    double vfov{90.0};
    /// Eye position.
    Point3 look_from{0, 0, 0};
    /// Target point.
    Point3 look_at{0, 0, -1};
    /// Up hint.
    Vec3   vup{0, 1, 0};
    /// Lens radius; 0 is a pinhole.
    double aperture{0.0};
    /// Distance to the plane of perfect focus.
    double focus_dist{0.0};
    /// Escape radiance.
    Background background;
    /// Samples per pixel (>= 1).
    int    samples_per_pixel{100};
    /// Maximum number of scatter events per path.
    int    max_depth{50};
    /// Relative confidence target for adaptive sampling; 0 disables it.
    double adaptive_tolerance{0.0};
    /// Samples per adaptive batch.
    int    adaptive_batch{32};
};

/**
 * @brief Thin-lens camera.
 * Maps pixel coordinates (origin top-left, y down) to primary rays with
 * anti-aliasing jitter and optional defocus blur.
 */
class Camera {
public:
    /// Validate @p cfg and precompute the viewport; throws std::invalid_argument.
    explicit Camera(const CameraConfig& cfg);

    /**
     * @brief Generate a primary ray through pixel (i,j).
     * @param i Pixel column in [0, width-1].
     * @param j Pixel row in [0, height-1], row 0 at the top.
     * @param rng Worker-owned random source for jitter and lens sampling.
     * @return Ray from the lens toward the focus plane.
     */
    Ray get_ray(int i, int j, Rng& rng) const;

    /// Sampling and output settings.
    const CameraConfig& config() const { return cfg_; }
    int width() const  { return cfg_.image_width; }
    int height() const { return cfg_.image_height; }
    /// Eye position.
    const Point3& center() const { return center_; }
    /// Center of pixel (0,0) on the focus plane.
    const Point3& pixel00() const { return pixel00_; }

private:
    CameraConfig cfg_;
    Point3 center_;
    Point3 pixel00_;
    Vec3   pixel_du_;
    Vec3   pixel_dv_;
    Vec3   u_, v_, w_;
    Vec3   defocus_u_;
    Vec3   defocus_v_;
};
