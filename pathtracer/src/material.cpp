#include "material.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

bool Lambertian::scatter(const Ray&, const Hit& h, Rng& rng, ScatterRecord& out) const {
    Vec3 dir = h.n + rng.unit_vector();
    // random vector cancelled the normal
    if (dir.near_zero()) dir = h.n;

    out.scattered   = Ray(h.p, dir);
    out.attenuation = albedo;
    out.reflected   = false;
    return true;
}

bool Metal::scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const {
    Vec3 dir = reflect(r_in.d.normalized(), h.n);
    if (fuzz > 0.0) dir += fuzz * rng.in_unit_sphere();

    if (dir.dot(h.n) <= 0.0) return false;

    out.scattered   = Ray(h.p, dir);
    out.attenuation = albedo;
    out.reflected   = false;
    return true;
}

double Dielectric::reflectance(double cosine, double ratio) {
    double r0 = (1.0 - ratio) / (1.0 + ratio);
    r0 = r0 * r0;
    return r0 + (1.0 - r0) * std::pow(1.0 - cosine, 5);
}

bool Dielectric::scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const {
    // eta = n_in / n_out; reverse when leaving the medium
    const double ratio = h.front_face ? (1.0 / ior) : ior;

    const Vec3 unit_dir  = r_in.d.normalized();
    const double cos_theta = std::min((-unit_dir).dot(h.n), 1.0);
    const double sin_theta = std::sqrt(std::max(0.0, 1.0 - cos_theta * cos_theta));

    const bool cannot_refract = ratio * sin_theta > 1.0;

    if (cannot_refract || reflectance(cos_theta, ratio) > rng.uniform()) {
        out.scattered = Ray(h.p, reflect(unit_dir, h.n));
        out.reflected = true;
    } else {
        out.scattered = Ray(h.p, refract(unit_dir, h.n, ratio));
        out.reflected = false;
    }
    out.attenuation = Color(1, 1, 1);
    return true;
}

MixedMaterial::MixedMaterial(std::shared_ptr<const Material> diff,
                             std::shared_ptr<const Material> spec, double w)
: diffuse(std::move(diff)), specular(std::move(spec)), weight(std::clamp(w, 0.0, 1.0)) {
    if (!diffuse || !specular) throw std::invalid_argument("MixedMaterial requires two materials");
}

bool MixedMaterial::scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const {
    if (rng.uniform() < weight) {
        return diffuse->scatter(r_in, h, rng, out);
    }
    return specular->scatter(r_in, h, rng, out);
}

Color MixedMaterial::emitted(const Hit& h) const {
    return diffuse->emitted(h) * weight + specular->emitted(h) * (1.0 - weight);
}

LayeredMaterial::LayeredMaterial(std::shared_ptr<const Material> coat,
                                 std::shared_ptr<const Material> base)
: outer(std::move(coat)), inner(std::move(base)) {
    if (!outer || !inner) throw std::invalid_argument("LayeredMaterial requires two materials");
}

bool LayeredMaterial::scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const {
    ScatterRecord coat;
    if (!outer->scatter(r_in, h, rng, coat)) {
        return inner->scatter(r_in, h, rng, out);
    }
    if (coat.reflected) {
        out = coat;
        return true;
    }
    if (!inner->scatter(coat.scattered, h, rng, out)) return false;
    out.attenuation = hadamard(coat.attenuation, out.attenuation);
    return true;
}

Color LayeredMaterial::emitted(const Hit& h) const {
    return inner->emitted(h);
}
