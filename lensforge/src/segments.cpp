#include "segments.h"
#include "span.h"

#include <cmath>

namespace {

/// Shared cap validation: 0 < height <= radius.
void check_cap(const char* what, double radius, double height) {
    const std::string prefix(what);
    require_geometry(radius > 0.0, prefix + " curvature radius must be positive");
    require_geometry(height > 0.0, prefix + " height must be positive");
    require_geometry(height <= radius, prefix + " height exceeds its curvature radius");
}

/// Chord half-width of a cap at its base.
inline double chord_half(double radius, double height) {
    const double c = radius - height;
    return std::sqrt(std::max(0.0, radius * radius - c * c));
}

} // anon

// ---------------- SphereSegment ----------------

SphereSegment::SphereSegment(double radius, double height, std::string name)
    : Primitive(std::move(name)), radius_(radius), height_(height) {
    check_cap("sphere segment", radius, height);
}

double SphereSegment::base_radius() const {
    return chord_half(radius_, height_);
}

HitList SphereSegment::local_hits(const Ray& r) const {
    const Span s = span_intersect(ball_span(r, Point3(0, 0, height_ - radius_), radius_),
                                  slab_span(r, 2, 0.0, kINF));
    return span_hits(r, s, this);
}

bool SphereSegment::local_contains(const Point3& p) const {
    if (p.z < 0.0) return false;
    const double dz = p.z - (height_ - radius_);
    return p.x*p.x + p.y*p.y + dz*dz <= radius_ * radius_;
}

BoundingBox SphereSegment::local_bounds() const {
    const double b = base_radius();
    return BoundingBox(Point3(-b, -b, 0.0), Point3(b, b, height_)).padded(kBoxPadding);
}

// ---------------- CylinderSegment ----------------

CylinderSegment::CylinderSegment(double radius, double height, double length, std::string name)
    : Primitive(std::move(name)), radius_(radius), height_(height), length_(length) {
    check_cap("cylinder segment", radius, height);
    require_geometry(length > 0.0, "cylinder segment length must be positive");
}

double CylinderSegment::base_half_width() const {
    return chord_half(radius_, height_);
}

HitList CylinderSegment::local_hits(const Ray& r) const {
    Span s = tube_span(r, 0, Point3(0, 0, height_ - radius_), radius_);
    s = span_intersect(s, slab_span(r, 2, 0.0, kINF));
    s = span_intersect(s, slab_span(r, 0, -0.5 * length_, 0.5 * length_));
    return span_hits(r, s, this);
}

bool CylinderSegment::local_contains(const Point3& p) const {
    if (p.z < 0.0 || std::abs(p.x) > 0.5 * length_) return false;
    const double dz = p.z - (height_ - radius_);
    return p.y*p.y + dz*dz <= radius_ * radius_;
}

BoundingBox CylinderSegment::local_bounds() const {
    const double b = base_half_width();
    return BoundingBox(Point3(-0.5 * length_, -b, 0.0),
                       Point3(0.5 * length_, b, height_)).padded(kBoxPadding);
}
