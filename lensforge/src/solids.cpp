#include "solids.h"
#include "span.h"

#include <sstream>

// ---------------- Sphere ----------------

Sphere::Sphere(double radius, std::string name)
    : Primitive(std::move(name)), radius_(radius) {
    require_geometry(radius > 0.0, "sphere radius must be positive");
}

HitList Sphere::local_hits(const Ray& r) const {
    return span_hits(r, ball_span(r, Point3(0, 0, 0), radius_), this);
}

bool Sphere::local_contains(const Point3& p) const {
    return p.x*p.x + p.y*p.y + p.z*p.z <= radius_ * radius_;
}

BoundingBox Sphere::local_bounds() const {
    return BoundingBox(Point3(-radius_, -radius_, -radius_),
                       Point3(radius_, radius_, radius_)).padded(kBoxPadding);
}

// ---------------- Cylinder ----------------

Cylinder::Cylinder(double radius, double length, std::string name)
    : Primitive(std::move(name)), radius_(radius), length_(length) {
    require_geometry(radius > 0.0, "cylinder radius must be positive");
    require_geometry(length > 0.0, "cylinder length must be positive");
}

HitList Cylinder::local_hits(const Ray& r) const {
    const Span s = span_intersect(tube_span(r, 2, Point3(0, 0, 0), radius_),
                                  slab_span(r, 2, 0.0, length_));
    return span_hits(r, s, this);
}

bool Cylinder::local_contains(const Point3& p) const {
    return p.z >= 0.0 && p.z <= length_ && p.x*p.x + p.y*p.y <= radius_ * radius_;
}

BoundingBox Cylinder::local_bounds() const {
    return BoundingBox(Point3(-radius_, -radius_, 0.0),
                       Point3(radius_, radius_, length_)).padded(kBoxPadding);
}

// ---------------- Box ----------------

Box::Box(const Point3& lower, const Point3& upper, std::string name)
    : Primitive(std::move(name)), lower_(lower), upper_(upper) {
    if (!(upper.x > lower.x && upper.y > lower.y && upper.z > lower.z)) {
        std::ostringstream msg;
        msg << "box corners are degenerate: lower " << lower << ", upper " << upper;
        throw GeometryError(msg.str());
    }
}

HitList Box::local_hits(const Ray& r) const {
    Span s = slab_span(r, 0, lower_.x, upper_.x);
    s = span_intersect(s, slab_span(r, 1, lower_.y, upper_.y));
    s = span_intersect(s, slab_span(r, 2, lower_.z, upper_.z));
    return span_hits(r, s, this);
}

bool Box::local_contains(const Point3& p) const {
    return BoundingBox(lower_, upper_).contains(p);
}

BoundingBox Box::local_bounds() const {
    return BoundingBox(lower_, upper_).padded(kBoxPadding);
}
