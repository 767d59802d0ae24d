#include "flat.h"

namespace {

/// Distance to the plane z=0, or -1 if the ray is parallel or misses the range.
double plane_z0_distance(const Ray& r) {
    if (r.d.z == 0.0) return -1.0;
    const double t = -r.o.z / r.d.z;
    return in_ray_range(r, t) ? t : -1.0;
}

} // anon

// ---------------- Circle ----------------

Circle::Circle(double radius, std::string name)
    : Primitive(std::move(name)), radius_(radius) {
    require_geometry(radius > 0.0, "circle radius must be positive");
}

HitList Circle::local_hits(const Ray& r) const {
    HitList hits;
    const double t = plane_z0_distance(r);
    if (t < 0.0) return hits;
    const Point3 p = r.at(t);
    if (p.x*p.x + p.y*p.y > radius_ * radius_) return hits;
    hits.push_back(make_intersection(r, t, Dir3(0, 0, 1), this));
    return hits;
}

bool Circle::local_contains(const Point3& p) const {
    return p.z == 0.0 && p.x*p.x + p.y*p.y <= radius_ * radius_;
}

BoundingBox Circle::local_bounds() const {
    return BoundingBox(Point3(-radius_, -radius_, 0.0),
                       Point3(radius_, radius_, 0.0)).padded(kBoxPadding);
}

// ---------------- Rectangle ----------------

Rectangle::Rectangle(double width, double height, std::string name)
    : Primitive(std::move(name)), width_(width), height_(height) {
    require_geometry(width > 0.0 && height > 0.0, "rectangle width and height must be positive");
}

HitList Rectangle::local_hits(const Ray& r) const {
    HitList hits;
    const double t = plane_z0_distance(r);
    if (t < 0.0) return hits;
    const Point3 p = r.at(t);
    if (std::abs(p.x) > 0.5 * width_ || std::abs(p.y) > 0.5 * height_) return hits;
    hits.push_back(make_intersection(r, t, Dir3(0, 0, 1), this));
    return hits;
}

bool Rectangle::local_contains(const Point3& p) const {
    return p.z == 0.0 && std::abs(p.x) <= 0.5 * width_ && std::abs(p.y) <= 0.5 * height_;
}

BoundingBox Rectangle::local_bounds() const {
    return BoundingBox(Point3(-0.5 * width_, -0.5 * height_, 0.0),
                       Point3(0.5 * width_, 0.5 * height_, 0.0)).padded(kBoxPadding);
}

// ---------------- Triangle ----------------

Triangle::Triangle(const Point3& v1, const Point3& v2, const Point3& v3, std::string name)
    : Primitive(std::move(name)), v1_(v1), v2_(v2), v3_(v3) {
    const Vec4 n = (v2 - v1).cross(v3 - v1);
    twice_area_ = n.length();
    require_geometry(twice_area_ > 0.0, "triangle vertices are collinear");
    normal_ = Dir3(n / twice_area_);
}

void Triangle::barycentric(const Point3& p, double& a, double& b, double& c) const {
    a = (v3_ - v2_).cross(p - v2_).dot(normal_) / twice_area_;
    b = (v1_ - v3_).cross(p - v3_).dot(normal_) / twice_area_;
    c = 1.0 - a - b;
}

HitList Triangle::local_hits(const Ray& r) const {
    HitList hits;
    const double denom = normal_.dot(r.d);
    if (denom == 0.0) return hits;
    const double t = normal_.dot(v1_ - r.o) / denom;
    if (!in_ray_range(r, t)) return hits;

    double a, b, c;
    barycentric(r.at(t), a, b, c);
    if (a < 0.0 || b < 0.0 || c < 0.0) return hits;

    hits.push_back(make_intersection(r, t, normal_, this));
    return hits;
}

bool Triangle::local_contains(const Point3& p) const {
    if (normal_.dot(p - v1_) != 0.0) return false;
    double a, b, c;
    barycentric(p, a, b, c);
    return a >= 0.0 && b >= 0.0 && c >= 0.0;
}

BoundingBox Triangle::local_bounds() const {
    BoundingBox box;
    box.extend(v1_);
    box.extend(v2_);
    box.extend(v3_);
    return box.padded(kBoxPadding);
}
