#include "geometry.h"
#include <cmath>
#include <stdexcept>
#include <utility>

Sphere::Sphere(const Point3& C, double R, std::shared_ptr<const Material> M)
: c(C), r(R), mat(std::move(M)) {
    if (!(R > 0.0)) throw std::invalid_argument("Sphere radius must be positive");
}

/**
 * @brief Ray–sphere intersection; stores the nearer root strictly inside ray_t.
 * @param ray Input ray.
 * @param ray_t Open interval of valid ray parameters.
 * @param out Filled with t, position, oriented normal, and material.
 * @return true if a root lies inside ray_t.
 */
bool Sphere::intersect(const Ray& ray, const Interval& ray_t, Hit& out) const {
    // ||o + t d - c||^2 = r^2, half-b form
    Vec3 oc = ray.o - c;
    double a       = ray.d.length_squared();
    double half_b  = oc.dot(ray.d);
    double cterm   = oc.length_squared() - this->r * this->r;
    double disc    = half_b*half_b - a*cterm;
    if (disc < 0.0) return false;

    double sqrtD = std::sqrt(disc);

    // try nearer root first
    double t = (-half_b - sqrtD) / a;
    if (!ray_t.surrounds(t)) {
        t = (-half_b + sqrtD) / a;
        if (!ray_t.surrounds(t)) return false;
    }

    out.t = t;
    out.p = ray.at(t);
    Vec3 outward = (out.p - c) / this->r;
    out.set_face_normal(ray, outward);
    out.mat = mat.get();
    return true;
}

Plane::Plane(const Point3& Q, const Vec3& U, const Vec3& V, std::shared_ptr<const Material> M)
: q(Q), u(U), v(V), mat(std::move(M)) {
    const Vec3 nn = u.cross(v);
    const double len2 = nn.length_squared();
    if (len2 < 1e-16) {
        throw std::invalid_argument("Plane/quad edge vectors are degenerate (u x v is zero)");
    }
    n = nn / std::sqrt(len2);
    D = n.dot(q);
    w = nn / len2;
}

bool Plane::solve(const Ray& r, const Interval& ray_t, double& t, double& alpha, double& beta) const {
    const double denom = n.dot(r.d);
    if (std::fabs(denom) < kEPS) return false;  // parallel

    t = (D - n.dot(r.o)) / denom;
    if (!ray_t.surrounds(t)) return false;

    const Vec3 planar = r.at(t) - q;
    alpha = w.dot(planar.cross(v));
    beta  = w.dot(u.cross(planar));
    return true;
}

bool Plane::intersect(const Ray& r, const Interval& ray_t, Hit& out) const {
    double t, alpha, beta;
    if (!solve(r, ray_t, t, alpha, beta)) return false;

    out.t = t;
    out.p = r.at(t);
    out.set_face_normal(r, n);
    out.mat = mat.get();
    return true;
}

bool Quad::intersect(const Ray& r, const Interval& ray_t, Hit& out) const {
    double t, alpha, beta;
    if (!solve(r, ray_t, t, alpha, beta)) return false;

    // outside the parallelogram
    const Interval unit(0.0, 1.0);
    if (!unit.contains(alpha) || !unit.contains(beta)) return false;

    out.t = t;
    out.p = r.at(t);
    out.set_face_normal(r, n);
    out.mat = mat.get();
    return true;
}

void PrimitiveList::add(std::shared_ptr<const Primitive> object) {
    if (object) objects_.push_back(std::move(object));
}

/**
 * @brief Closest-hit search over all children.
 * @param r Ray to test.
 * @param ray_t Open interval of acceptable t.
 * @return true if any child is hit; @p out holds the nearest hit.
 */
bool PrimitiveList::intersect(const Ray& r, const Interval& ray_t, Hit& out) const {
    Hit    temp;
    bool   hit_any   = false;
    double closest_t = ray_t.max;

    for (const auto& obj : objects_) {
        if (obj->intersect(r, Interval(ray_t.min, closest_t), temp)) {
            hit_any   = true;
            closest_t = temp.t;  // tighten the search window
            out       = temp;    // keep the closest so far
        }
    }
    return hit_any;
}
