/**
 * @file Geometry.hpp
 * @brief Small vector types and segment intersection used by the experiments
 *
 * Point2D carries photon and particle positions in model space (meters),
 * Vector3D carries spin / Bloch directions. LineSegment is the stationary
 * geometry of optical elements.
 */

#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include <optional>

namespace QMSIM {

/**
 * @brief 2D point / direction in model space
 */
struct Point2D {
    double x, y;

    Point2D() : x(0), y(0) {}
    Point2D(double x_, double y_) : x(x_), y(y_) {}

    double distanceTo(const Point2D& other) const;
    Point2D operator+(const Point2D& other) const;
    Point2D operator-(const Point2D& other) const;
    Point2D operator*(double s) const;
    bool operator==(const Point2D& other) const;
    double dot(const Point2D& other) const;
    double cross(const Point2D& other) const;   ///< z-component of the 3D cross product
    double norm() const;
    Point2D normalized() const;
    Point2D rotated(double angle) const;        ///< counter-clockwise, radians
};

// Unit directions
namespace Directions {
    const Point2D RIGHT(1.0, 0.0);
    const Point2D LEFT(-1.0, 0.0);
    const Point2D UP(0.0, 1.0);
    const Point2D DOWN(0.0, -1.0);
}

/**
 * @brief 3D vector for spin and Bloch-sphere directions
 */
struct Vector3D {
    double x, y, z;

    Vector3D() : x(0), y(0), z(0) {}
    Vector3D(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vector3D operator+(const Vector3D& other) const;
    Vector3D operator-(const Vector3D& other) const;
    Vector3D operator-() const;
    Vector3D operator*(double s) const;
    double dot(const Vector3D& other) const;
    Vector3D cross(const Vector3D& other) const;
    double norm() const;
    Vector3D normalized() const;
    double angleTo(const Vector3D& other) const;
};

/**
 * @brief Straight segment between two points
 */
struct LineSegment {
    Point2D start;
    Point2D end;

    LineSegment() = default;
    LineSegment(const Point2D& s, const Point2D& e) : start(s), end(e) {}

    double length() const { return start.distanceTo(end); }
    Point2D midpoint() const { return (start + end) * 0.5; }
};

/**
 * @brief Crossing of a moving segment with a stationary one
 *
 * t is the fraction along the moving segment, s the fraction along the
 * stationary one; both lie in [0, 1].
 */
struct SegmentIntersection {
    Point2D point;
    double t;
    double s;
};

/**
 * @brief Intersect segment p0->p1 with segment q0->q1
 *
 * Parallel (including collinear) and zero-length segments never intersect.
 */
std::optional<SegmentIntersection> intersectSegments(const Point2D& p0, const Point2D& p1,
                                                     const Point2D& q0, const Point2D& q1);

} // namespace QMSIM

#endif // GEOMETRY_HPP
