#include "Geometry.hpp"
#include <algorithm>
#include <cmath>

namespace QMSIM {

// =============================================================================
// Point2D
// =============================================================================

double Point2D::distanceTo(const Point2D& other) const {
    return (*this - other).norm();
}

Point2D Point2D::operator+(const Point2D& other) const {
    return Point2D(x + other.x, y + other.y);
}

Point2D Point2D::operator-(const Point2D& other) const {
    return Point2D(x - other.x, y - other.y);
}

Point2D Point2D::operator*(double s) const {
    return Point2D(x * s, y * s);
}

bool Point2D::operator==(const Point2D& other) const {
    return x == other.x && y == other.y;
}

double Point2D::dot(const Point2D& other) const {
    return x * other.x + y * other.y;
}

double Point2D::cross(const Point2D& other) const {
    return x * other.y - y * other.x;
}

double Point2D::norm() const {
    return std::sqrt(x * x + y * y);
}

Point2D Point2D::normalized() const {
    double n = norm();
    if (n < 1e-15) return Point2D(0, 0);
    return Point2D(x / n, y / n);
}

Point2D Point2D::rotated(double angle) const {
    double c = std::cos(angle);
    double s = std::sin(angle);
    return Point2D(c * x - s * y, s * x + c * y);
}

// =============================================================================
// Vector3D
// =============================================================================

Vector3D Vector3D::operator+(const Vector3D& other) const {
    return Vector3D(x + other.x, y + other.y, z + other.z);
}

Vector3D Vector3D::operator-(const Vector3D& other) const {
    return Vector3D(x - other.x, y - other.y, z - other.z);
}

Vector3D Vector3D::operator-() const {
    return Vector3D(-x, -y, -z);
}

Vector3D Vector3D::operator*(double s) const {
    return Vector3D(x * s, y * s, z * s);
}

double Vector3D::dot(const Vector3D& other) const {
    return x * other.x + y * other.y + z * other.z;
}

Vector3D Vector3D::cross(const Vector3D& other) const {
    return Vector3D(y * other.z - z * other.y,
                    z * other.x - x * other.z,
                    x * other.y - y * other.x);
}

double Vector3D::norm() const {
    return std::sqrt(x * x + y * y + z * z);
}

Vector3D Vector3D::normalized() const {
    double n = norm();
    if (n < 1e-15) return Vector3D(0, 0, 0);
    return Vector3D(x / n, y / n, z / n);
}

double Vector3D::angleTo(const Vector3D& other) const {
    double denom = norm() * other.norm();
    if (denom < 1e-30) return 0.0;
    double c = std::clamp(dot(other) / denom, -1.0, 1.0);
    return std::acos(c);
}

// =============================================================================
// Segment intersection
// =============================================================================

std::optional<SegmentIntersection> intersectSegments(const Point2D& p0, const Point2D& p1,
                                                     const Point2D& q0, const Point2D& q1) {
    Point2D r = p1 - p0;
    Point2D s = q1 - q0;

    if (r.norm() < 1e-15 || s.norm() < 1e-15) {
        return std::nullopt;
    }

    double denom = r.cross(s);
    if (std::abs(denom) < 1e-15) {
        return std::nullopt;
    }

    Point2D qp = q0 - p0;
    double t = qp.cross(s) / denom;
    double u = qp.cross(r) / denom;

    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) {
        return std::nullopt;
    }

    SegmentIntersection hit;
    hit.point = p0 + r * t;
    hit.t = t;
    hit.s = u;
    return hit;
}

} // namespace QMSIM
