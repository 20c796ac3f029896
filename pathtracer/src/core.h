#ifndef CORE_H
#define CORE_H

#include <cmath>
#include <algorithm>
#include <limits>

/// Numerical epsilon for float comparisons.
constexpr double kEPS = 1e-8;
/// Positive infinity shortcut.
constexpr double kINF = std::numeric_limits<double>::infinity();
/// Pi, used by the camera for field-of-view conversion.
constexpr double kPI = 3.1415926535897932385;

/// Degrees-to-radians conversion.
inline double deg2rad(double d){ return d * kPI / 180.0; }

/**
 * @brief Plain 3D vector used for points, directions, and offsets.
 * Provides the arithmetic, norms, and normalization used across geometry and sampling.
 */
struct Vec3 {
    /// X component.
    double x{},
    /// Y component.
           y{},
    /// Z component.
           z{};

    /// Default-initialized (zeros).
    Vec3() = default;
    /// From components.
    Vec3(double xx, double yy, double zz): x(xx), y(yy), z(zz) {}

    /// Vector addition.
    Vec3 operator+(const Vec3& v) const { return {x+v.x, y+v.y, z+v.z}; }
    /// Vector subtraction.
    Vec3 operator-(const Vec3& v) const { return {x-v.x, y-v.y, z-v.z}; }
    /// Scalar multiply.
    Vec3 operator*(double s)     const { return {x*s, y*s, z*s}; }
    /// Scalar divide.
    Vec3 operator/(double s)     const { return {x/s, y/s, z/s}; }
    /// In-place addition.
    Vec3& operator+=(const Vec3& v){ x+=v.x; y+=v.y; z+=v.z; return *this; }
    /// In-place scalar multiply.
    Vec3& operator*=(double s){ x*=s; y*=s; z*=s; return *this; }
    /// Unary minus.
    Vec3 operator-() const { return {-x, -y, -z}; }

    /// Dot product.
    double dot(const Vec3& v) const { return x*v.x + y*v.y + z*v.z; }
    /// Cross product.
    Vec3 cross(const Vec3& v) const {
        return { y*v.z - z*v.y, z*v.x - x*v.z, x*v.y - y*v.x };
    }
    /// Squared Euclidean length.
    double length_squared() const { return dot(*this); }
    /// Euclidean length.
    double length() const { return std::sqrt(length_squared()); }
    /// Unit-length version; returns +Y when the vector is too small to normalize.
    Vec3 normalized() const {
        double L = length();
        if (L > kEPS) {
            return {x/L, y/L, z/L};
        }
        return {0, 1, 0};
    }
    /// True if every component is close to zero.
    bool near_zero() const {
        const double s = 1e-8;
        return std::fabs(x) < s && std::fabs(y) < s && std::fabs(z) < s;
    }
};

/// Scalar–vector multiplication.
inline Vec3 operator*(double s, const Vec3& v){ return v*s; }

/// Positions share the vector representation.
using Point3 = Vec3;

/// Mirror reflection: R = I - 2(I·N)N, with I pointing into the surface.
inline Vec3 reflect(const Vec3& incident, const Vec3& normal) {
    return incident - 2.0 * incident.dot(normal) * normal;
}

/**
 * @brief Snell refraction of a unit incident direction.
 * @param uv Unit incident direction (pointing into the surface).
 * @param n Unit normal on the incident side.
 * @param eta Ratio n_in / n_out.
 * @return Refracted direction; callers must rule out total internal reflection first.
 */
inline Vec3 refract(const Vec3& uv, const Vec3& n, double eta) {
    double cos_theta = std::min((-uv).dot(n), 1.0);
    Vec3 r_out_perp = eta * (uv + cos_theta * n);
    Vec3 r_out_parallel = -std::sqrt(std::fabs(1.0 - r_out_perp.length_squared())) * n;
    return r_out_perp + r_out_parallel;
}

/**
 * @brief Geometric ray with origin and direction.
 * The direction is stored as given; at(t) evaluates origin + t*direction.
 */
struct Ray {
    /// Origin point.
    Point3 o;
    /// Direction (not necessarily unit length).
    Vec3 d;
    /// Default constructor.
    Ray() = default;
    /// Construct with origin and direction.
    Ray(const Point3& oo, const Vec3& dd): o(oo), d(dd) {}
    /// Point at parameter t along the ray.
    Point3 at(double t) const { return o + d*t; }
};

/**
 * @brief Linear RGB color with double channels.
 * Supports addition, scalar and channel-wise products for radiance accumulation.
 */
struct Color {
    /// Red channel.
    double r{},
    /// Green channel.
           g{},
    /// Blue channel.
           b{};

    /// Default-initialized (black).
    Color() = default;
    /// From components.
    Color(double rr, double gg, double bb): r(rr), g(gg), b(bb) {}
    /// Channel-wise addition.
    Color operator+(const Color& c) const { return {r+c.r, g+c.g, b+c.b}; }
    /// Scalar multiply.
    Color operator*(double s) const { return {r*s, g*s, b*s}; }
    /// In-place add.
    Color& operator+=(const Color& c){ r+=c.r; g+=c.g; b+=c.b; return *this; }

    /// Perceptual luminance estimate.
    double illuminance() const { return 0.2126 * r + 0.7152 * g + 0.0722 * b; }
};

/// Channel-wise (Hadamard) color product.
inline Color hadamard(const Color& a, const Color& b){
    return {a.r*b.r, a.g*b.g, a.b*b.b};
}

/// Linear interpolation between two colors, a=0 gives @p from.
inline Color lerp(const Color& from, const Color& to, double a){
    return from * (1.0 - a) + to * a;
}

#endif
