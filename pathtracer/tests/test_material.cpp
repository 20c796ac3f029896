/**
 * @brief Material unit tests: scattering laws, absorption, emission, and composites.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include "geometry.h"
#include "material.h"
#include "rng.h"

namespace {

/// Front-facing hit on the y = 0 plane at the origin, normal +Y.
Hit floor_hit(const Material* m) {
    Hit h;
    h.t = 1.0;
    h.p = Point3(0, 0, 0);
    h.n = Vec3(0, 1, 0);
    h.front_face = true;
    h.mat = m;
    return h;
}

} // namespace

/// Lambertian never absorbs and always attenuates by its albedo.
TEST_CASE("Lambertian scatter", "[material][lambertian]") {
    Lambertian lam(Color(0.2, 0.4, 0.6));
    Hit h = floor_hit(&lam);
    Ray in(Point3(0, 1, 0), Vec3(0, -1, 0));
    Rng rng(1);

    for (int k = 0; k < 500; ++k) {
        ScatterRecord rec;
        REQUIRE(lam.scatter(in, h, rng, rec));
        REQUIRE(rec.attenuation.r == Catch::Approx(0.2));
        REQUIRE(rec.attenuation.g == Catch::Approx(0.4));
        REQUIRE(rec.attenuation.b == Catch::Approx(0.6));
        REQUIRE_FALSE(rec.scattered.d.near_zero());
        REQUIRE(rec.scattered.d.dot(h.n) >= 0.0);
    }
    REQUIRE(lam.emitted(h).r == 0.0);
}

/// Metal: perfect mirror at fuzz 0; fuzz 1 mixes absorption and outward scatter.
TEST_CASE("Metal scatter", "[material][metal]") {
    Rng rng(2);

    SECTION("Fuzz 0 reflects normal incidence straight back") {
        Metal m(Color(0.9, 0.9, 0.9), 0.0);
        Hit h = floor_hit(&m);
        Ray in(Point3(0, 3, 0), Vec3(0, -3, 0));
        ScatterRecord rec;
        REQUIRE(m.scatter(in, h, rng, rec));
        const Vec3 d = rec.scattered.d.normalized();
        REQUIRE(d.x == Catch::Approx(0.0).margin(1e-12));
        REQUIRE(d.y == Catch::Approx(1.0));
        REQUIRE(d.z == Catch::Approx(0.0).margin(1e-12));
        REQUIRE(rec.attenuation.r == Catch::Approx(0.9));
    }

    SECTION("Fuzz 1 sometimes absorbs, otherwise points outward") {
        Metal m(Color(1, 1, 1), 1.0);
        Hit h = floor_hit(&m);
        // grazing incidence makes absorption likely
        Ray in(Point3(-1, 0.1, 0), Vec3(1, -0.1, 0));
        int absorbed = 0, scattered = 0;
        for (int k = 0; k < 2000; ++k) {
            ScatterRecord rec;
            if (m.scatter(in, h, rng, rec)) {
                ++scattered;
                REQUIRE(rec.scattered.d.dot(h.n) > 0.0);
            } else {
                ++absorbed;
            }
        }
        REQUIRE(absorbed > 0);
        REQUIRE(scattered > 0);
    }

    SECTION("Fuzz is clamped to [0,1]") {
        REQUIRE(Metal(Color(1, 1, 1), 4.0).fuzz == 1.0);
        REQUIRE(Metal(Color(1, 1, 1), -1.0).fuzz == 0.0);
    }
}

/// Dielectric: white attenuation, total internal reflection, and refraction.
TEST_CASE("Dielectric scatter", "[material][dielectric]") {
    Dielectric glass(1.5);
    Rng rng(3);

    SECTION("Normal incidence mostly refracts straight through") {
        Hit h = floor_hit(&glass);
        Ray in(Point3(0, 1, 0), Vec3(0, -1, 0));
        int through = 0;
        for (int k = 0; k < 200; ++k) {
            ScatterRecord rec;
            REQUIRE(glass.scatter(in, h, rng, rec));
            REQUIRE(rec.attenuation.r == 1.0);
            if (!rec.reflected) {
                ++through;
                REQUIRE(rec.scattered.d.normalized().y == Catch::Approx(-1.0));
            }
        }
        // Schlick reflectance at normal incidence is 4%
        REQUIRE(through > 150);
    }

    /// Leaving glass at a steep angle cannot refract.
    SECTION("Total internal reflection") {
        Hit h = floor_hit(&glass);
        h.front_face = false;  // inside the glass
        Ray in(Point3(-1, 0.2, 0), Vec3(1, -0.2, 0));
        for (int k = 0; k < 100; ++k) {
            ScatterRecord rec;
            REQUIRE(glass.scatter(in, h, rng, rec));
            REQUIRE(rec.reflected);
            REQUIRE(rec.scattered.d.y > 0.0);
        }
    }

    SECTION("Schlick endpoints") {
        REQUIRE(Dielectric::reflectance(1.0, 1.0 / 1.5) == Catch::Approx(0.04));
        REQUIRE(Dielectric::reflectance(0.0, 1.0 / 1.5) == Catch::Approx(1.0));
    }
}

/// DiffuseLight emits and never scatters.
TEST_CASE("DiffuseLight", "[material][light]") {
    DiffuseLight light(Color(4, 4, 4));
    Hit h = floor_hit(&light);
    Rng rng(4);
    ScatterRecord rec;
    REQUIRE_FALSE(light.scatter(Ray(Point3(0, 1, 0), Vec3(0, -1, 0)), h, rng, rec));
    REQUIRE(light.emitted(h).g == Catch::Approx(4.0));
}

/// Mixed delegates by discrete choice; Layered returns coat reflections or the base result.
TEST_CASE("Composite materials", "[material][mixed][layered]") {
    auto diffuse = std::make_shared<Lambertian>(Color(0.1, 0.2, 0.3));
    auto mirror  = std::make_shared<Metal>(Color(0.7, 0.7, 0.7), 0.0);
    auto lamp    = std::make_shared<DiffuseLight>(Color(2, 2, 2));
    Rng rng(5);
    Ray in(Point3(0, 1, 0), Vec3(0, -1, 0));

    SECTION("Weight 1 always diffuse, weight 0 always specular") {
        MixedMaterial all_diffuse(diffuse, mirror, 1.0);
        MixedMaterial all_specular(diffuse, mirror, 0.0);
        Hit h = floor_hit(&all_diffuse);
        for (int k = 0; k < 50; ++k) {
            ScatterRecord a, b;
            REQUIRE(all_diffuse.scatter(in, h, rng, a));
            REQUIRE(a.attenuation.r == Catch::Approx(0.1));
            REQUIRE(all_specular.scatter(in, h, rng, b));
            REQUIRE(b.attenuation.r == Catch::Approx(0.7));
        }
    }

    SECTION("Intermediate weight picks both children") {
        MixedMaterial half(diffuse, mirror, 0.5);
        Hit h = floor_hit(&half);
        int d = 0, s = 0;
        for (int k = 0; k < 400; ++k) {
            ScatterRecord rec;
            REQUIRE(half.scatter(in, h, rng, rec));
            if (rec.attenuation.r == Catch::Approx(0.1)) ++d; else ++s;
        }
        REQUIRE(d > 0);
        REQUIRE(s > 0);
    }

    SECTION("Mixed emission is weighted") {
        MixedMaterial glow(lamp, diffuse, 0.25);
        Hit h = floor_hit(&glow);
        REQUIRE(glow.emitted(h).r == Catch::Approx(0.5));
    }

    SECTION("Layered: coat reflections keep white, transmissions take the base albedo") {
        LayeredMaterial coated(std::make_shared<Dielectric>(1.5), diffuse);
        Hit h = floor_hit(&coated);
        int reflected = 0, base = 0;
        // grazing angle so the coat reflects often
        Ray grazing(Point3(-1, 0.05, 0), Vec3(1, -0.05, 0));
        for (int k = 0; k < 500; ++k) {
            ScatterRecord rec;
            REQUIRE(coated.scatter(grazing, h, rng, rec));
            if (rec.reflected) {
                ++reflected;
                REQUIRE(rec.attenuation.r == 1.0);
            } else {
                ++base;
                REQUIRE(rec.attenuation.r == Catch::Approx(0.1));
            }
        }
        REQUIRE(reflected > 0);
        REQUIRE(base > 0);
    }

    SECTION("Layered: absorbing coat falls back to the base material") {
        LayeredMaterial coated(lamp, diffuse);
        Hit h = floor_hit(&coated);
        ScatterRecord rec;
        REQUIRE(coated.scatter(in, h, rng, rec));
        REQUIRE(rec.attenuation.b == Catch::Approx(0.3));
        REQUIRE(coated.emitted(h).r == 0.0);
    }
}
