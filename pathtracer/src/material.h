#pragma once
#include <algorithm>
#include <memory>
#include "core.h"
#include "geometry.h"
#include "rng.h"

/// ScatterRecord: outcome of a non-absorbing scatter event.
struct ScatterRecord {
    /// Channel-wise multiplier applied to light returning along the scattered ray.
    Color attenuation{1, 1, 1};
    /// Continuation ray leaving the surface.
    Ray   scattered;
    /// True if the ray was mirrored off a dielectric boundary rather than transmitted.
    bool  reflected{false};
};

/**
 * @brief Material: scattering law attached to a surface.
 * Materials are immutable after construction and may be shared between primitives
 * and between render workers. All randomness comes from the caller's Rng.
 */
struct Material {
    virtual ~Material() = default;

    /**
     * @brief Scatter an incoming ray at a hit.
     * @param r_in Incoming ray.
     * @param h Hit record (normal faces against r_in).
     * @param rng Worker-owned random source.
     * @param out Filled with attenuation and scattered ray on success.
     * @return false if the ray is absorbed.
     */
    virtual bool scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const {
        (void)r_in; (void)h; (void)rng; (void)out;
        return false;
    }

    /// Emitted radiance at the hit; black for non-emissive materials.
    virtual Color emitted(const Hit& h) const {
        (void)h;
        return Color(0, 0, 0);
    }
};

/// Lambertian: ideal diffuse reflector; never absorbs.
struct Lambertian : Material {
    /// Diffuse reflectance.
    Color albedo;

    explicit Lambertian(const Color& a) : albedo(a) {}

    bool scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const override;
};

/// Metal: mirror reflection perturbed by fuzz in [0,1].
struct Metal : Material {
    /// Specular tint.
    Color  albedo;
    /// Roughness, clamped to [0,1].
    double fuzz{0.0};

    Metal(const Color& a, double f) : albedo(a), fuzz(f < 1.0 ? std::max(0.0, f) : 1.0) {}

    /// Absorbs when the fuzzed reflection points into the surface.
    bool scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const override;
};

/// Dielectric: clear refractive material (glass, water) with Schlick reflectance.
struct Dielectric : Material {
    /// Index of refraction relative to the surrounding medium.
    double ior{1.5};

    explicit Dielectric(double index) : ior(index) {}

    bool scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const override;

    /// Schlick's approximation of Fresnel reflectance.
    static double reflectance(double cosine, double ratio);
};

/// DiffuseLight: emitter with constant radiance; never scatters.
struct DiffuseLight : Material {
    /// Emitted radiance.
    Color emit;

    explicit DiffuseLight(const Color& e) : emit(e) {}

    Color emitted(const Hit&) const override { return emit; }
};

/**
 * @brief MixedMaterial: picks the diffuse child with probability weight, else the specular one.
 * The choice is discrete per scatter event; results are never blended.
 */
struct MixedMaterial : Material {
    std::shared_ptr<const Material> diffuse;
    std::shared_ptr<const Material> specular;
    /// Probability of the diffuse child, clamped to [0,1].
    double weight{0.5};

    MixedMaterial(std::shared_ptr<const Material> diff, std::shared_ptr<const Material> spec, double w);

    bool scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const override;
    /// Weighted sum of the children's emission.
    Color emitted(const Hit& h) const override;
};

/**
 * @brief LayeredMaterial: coating (usually a Dielectric) over a base material.
 * A specular reflection off the coating is returned as is; a transmitted ray continues
 * into the base material; if the coating absorbs, the base material sees the original ray.
 */
struct LayeredMaterial : Material {
    std::shared_ptr<const Material> outer;
    std::shared_ptr<const Material> inner;

    LayeredMaterial(std::shared_ptr<const Material> coat, std::shared_ptr<const Material> base);

    bool scatter(const Ray& r_in, const Hit& h, Rng& rng, ScatterRecord& out) const override;
    /// Emission of the base material.
    Color emitted(const Hit& h) const override;
};
