#pragma once
#include <memory>
#include <utility>
#include <vector>
#include "core.h"
#include "interval.h"

struct Material;

/// Hit: intersection payload for a ray–primitive query.
struct Hit {
    /// Parametric distance along ray (∞ if no hit).
    double t{kINF};
    /// World-space hit position.
    Point3 p;
    /// Unit normal, always oriented against the incoming ray.
    Vec3   n{0, 1, 0};
    /// Material at the hit (non-owning; the primitive keeps it alive).
    const Material* mat{nullptr};
    /// True if the geometric outward normal already opposed the ray.
    bool   front_face{true};

    /**
     * @brief Orient the stored normal to face against the incident ray.
     * @param r Incident ray.
     * @param outward Geometric outward normal (unit).
     */
    inline void set_face_normal(const Ray& r, const Vec3& outward) {
        front_face = r.d.dot(outward) < 0.0;
        n = front_face ? outward : -outward;
    }
};

/// Primitive: abstract renderable that supports ray queries.
struct Primitive {
    virtual ~Primitive() = default;

    /**
     * @brief Closest-hit test strictly inside ray_t.
     * @param r Input ray.
     * @param ray_t Open interval of acceptable t values.
     * @param out Filled with hit data if found.
     * @return true if a valid hit exists.
     */
    virtual bool intersect(const Ray& r, const Interval& ray_t, Hit& out) const = 0;
};

/// Sphere: centered ball primitive with radius r.
struct Sphere : Primitive {
    /// Center in world space.
    Point3 c;
    /// Radius (>0).
    double r{1.0};
    /// Surface material (shared).
    std::shared_ptr<const Material> mat;

    /// Construct with center, radius, and material; throws std::invalid_argument if R <= 0.
    Sphere(const Point3& C, double R, std::shared_ptr<const Material> M);

    /**
     * @brief Ray–sphere closest-hit strictly inside ray_t.
     * @param r Input ray (direction need not be unit).
     * @param ray_t Open interval of acceptable t.
     * @param out Hit with oriented normal and material.
     * @return true on hit.
     */
    bool intersect(const Ray& r, const Interval& ray_t, Hit& out) const override;
};

/**
 * @brief Plane: unbounded surface through q spanned by edge vectors u and v.
 * Caches the unit normal, the plane constant D = n·q, and w = (u×v)/|u×v|²
 * used to recover planar coordinates of a hit point.
 */
struct Plane : Primitive {
    /// Point on the plane.
    Point3 q;
    /// First spanning vector.
    Vec3 u;
    /// Second spanning vector.
    Vec3 v;
    /// Unit normal (u×v normalized).
    Vec3 n;
    /// Plane constant n·q.
    double D{0.0};
    /// Basis helper (u×v)/|u×v|².
    Vec3 w;
    /// Surface material (shared).
    std::shared_ptr<const Material> mat;

    /// Construct from a point and spanning vectors; throws std::invalid_argument if u×v ≈ 0.
    Plane(const Point3& Q, const Vec3& U, const Vec3& V, std::shared_ptr<const Material> M);

    /**
     * @brief Solve for the supporting-plane hit and its planar coordinates.
     * @param r Input ray.
     * @param ray_t Open interval of acceptable t.
     * @param t Output ray parameter.
     * @param alpha Output coordinate along u.
     * @param beta Output coordinate along v.
     * @return false if the ray is parallel or t is out of range.
     */
    bool solve(const Ray& r, const Interval& ray_t, double& t, double& alpha, double& beta) const;

    bool intersect(const Ray& r, const Interval& ray_t, Hit& out) const override;
};

/// Quad: parallelogram q + a·u + b·v with a, b in [0,1].
struct Quad : Plane {
    /// Construct from corner and edge vectors; throws std::invalid_argument if degenerate.
    Quad(const Point3& Q, const Vec3& U, const Vec3& V, std::shared_ptr<const Material> M)
    : Plane(Q, U, V, std::move(M)) {}

    bool intersect(const Ray& r, const Interval& ray_t, Hit& out) const override;
};

/**
 * @brief Aggregate of child primitives answering closest-hit queries.
 * Narrows the search interval to the nearest hit found so far while iterating.
 */
class PrimitiveList final : public Primitive {
public:
    PrimitiveList() = default;

    /// Append a child (null children are ignored).
    void add(std::shared_ptr<const Primitive> object);
    /// Remove all children.
    void clear() { objects_.clear(); }
    /// Number of children.
    std::size_t size() const { return objects_.size(); }
    /// True if no children.
    bool empty() const { return objects_.empty(); }
    /// Read-only access to children.
    const std::vector<std::shared_ptr<const Primitive>>& objects() const { return objects_; }

    /**
     * @brief Globally closest hit among all children strictly inside ray_t.
     * @param r Input ray.
     * @param ray_t Open interval of acceptable t.
     * @param out Filled with the nearest hit.
     * @return true if any child is hit.
     */
    bool intersect(const Ray& r, const Interval& ray_t, Hit& out) const override;

private:
    std::vector<std::shared_ptr<const Primitive>> objects_;
};
