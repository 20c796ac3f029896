#include "camera.h"
#include <cmath>
#include <stdexcept>

Camera::Camera(const CameraConfig& cfg) : cfg_(cfg) {
    if (cfg_.image_width <= 0 || cfg_.image_height <= 0)
        throw std::invalid_argument("Camera image size must be positive");
    if (cfg_.samples_per_pixel < 1)
        throw std::invalid_argument("Camera needs at least one sample per pixel");
    if (cfg_.max_depth < 0)
        throw std::invalid_argument("Camera max_depth must be >= 0");
    if (!(cfg_.vfov > 0.0 && cfg_.vfov < 180.0))
        throw std::invalid_argument("Camera vfov must be in (0, 180) degrees");
    if (cfg_.aperture < 0.0)
        throw std::invalid_argument("Camera aperture must be >= 0");
    if (cfg_.adaptive_batch < 1) cfg_.adaptive_batch = 1;

    const Vec3 view = cfg_.look_from - cfg_.look_at;
    if (view.near_zero())
        throw std::invalid_argument("Camera look_from and look_at coincide");

    const double focus = cfg_.focus_dist > 0.0 ? cfg_.focus_dist : view.length();
    cfg_.focus_dist = focus;

    center_ = cfg_.look_from;

    const double h = std::tan(deg2rad(cfg_.vfov) / 2.0);
    const double viewport_h = 2.0 * h * focus;
    const double viewport_w = viewport_h * (double(cfg_.image_width) / double(cfg_.image_height));

    w_ = view.normalized();
    const Vec3 side = cfg_.vup.cross(w_);
    if (side.near_zero())
        throw std::invalid_argument("Camera vup is parallel to the view direction");
    u_ = side.normalized();
    v_ = w_.cross(u_);

    // viewport edges: u to the right, v downward (row 0 at the top)
    const Vec3 viewport_u = u_ * viewport_w;
    const Vec3 viewport_v = -v_ * viewport_h;

    pixel_du_ = viewport_u / double(cfg_.image_width);
    pixel_dv_ = viewport_v / double(cfg_.image_height);

    const Point3 upper_left = center_ - w_ * focus - viewport_u / 2.0 - viewport_v / 2.0;
    pixel00_ = upper_left + 0.5 * (pixel_du_ + pixel_dv_);

    defocus_u_ = u_ * cfg_.aperture;
    defocus_v_ = v_ * cfg_.aperture;
}

Ray Camera::get_ray(int i, int j, Rng& rng) const {
    Point3 sample = pixel00_ + pixel_du_ * double(i) + pixel_dv_ * double(j);

    // single-sample renders look through the pixel center
    if (cfg_.samples_per_pixel > 1) {
        const double px = rng.uniform() - 0.5;
        const double py = rng.uniform() - 0.5;
        sample += pixel_du_ * px + pixel_dv_ * py;
    }

    Point3 origin = center_;
    if (cfg_.aperture > 0.0) {
        const Vec3 p = rng.in_unit_disk();
        origin += defocus_u_ * p.x + defocus_v_ * p.y;
    }
    return Ray(origin, sample - origin);
}
