#include "mirror.h"
#include "csg.h"
#include "solids.h"
#include "transform.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

FrameExtent frame_extent(const MirrorFrame& f) {
    if (f.shape == FrameShape::Round) {
        return round_frame_extent(f.diameter, f.aperture, f.decenter_x, f.decenter_y);
    }
    return rect_frame_extent(f.width, f.height, f.aperture, f.decenter_x, f.decenter_y);
}

double half_x(const MirrorFrame& f) {
    return 0.5 * (f.shape == FrameShape::Round ? f.diameter : f.width);
}

double half_y(const MirrorFrame& f) {
    return 0.5 * (f.shape == FrameShape::Round ? f.diameter : f.height);
}

/**
 * Largest value of a smooth function over a circle: a coarse scan, then a ternary search
 * between the neighbours of the best sample. NaN if any sample is NaN.
 */
template <class F>
double max_on_circle(F f, double cx, double cy, double r) {
    constexpr int kSamples = 360;
    const double step = 2.0 * kPI / kSamples;
    auto at = [&](double a) { return f(cx + r * std::cos(a), cy + r * std::sin(a)); };

    int best = 0;
    double best_value = -kINF;
    for (int i = 0; i < kSamples; ++i) {
        const double v = at(i * step);
        if (std::isnan(v)) return v;
        if (v > best_value) { best_value = v; best = i; }
    }

    double lo = (best - 1) * step, hi = (best + 1) * step;
    for (int k = 0; k < 100; ++k) {
        const double m1 = lo + (hi - lo) / 3.0;
        const double m2 = hi - (hi - lo) / 3.0;
        if (at(m1) < at(m2)) lo = m1;
        else hi = m2;
    }
    const double refined = at(0.5 * (lo + hi));
    if (std::isnan(refined)) return refined;
    return std::max(best_value, refined);
}

FaceSpec as_convex(FaceSpec face) {
    face.shape = FaceShape::Convex;
    return face;
}

} // anon

MirrorFrame MirrorFrame::round(double diameter, double aperture, double decenter_x, double decenter_y) {
    MirrorFrame f;
    f.shape = FrameShape::Round;
    f.diameter = diameter;
    f.aperture = aperture;
    f.decenter_x = decenter_x;
    f.decenter_y = decenter_y;
    return f;
}

MirrorFrame MirrorFrame::rectangular(double width, double height, double aperture,
                                     double decenter_x, double decenter_y) {
    MirrorFrame f;
    f.shape = FrameShape::Rectangular;
    f.width = width;
    f.height = height;
    f.aperture = aperture;
    f.decenter_x = decenter_x;
    f.decenter_y = decenter_y;
    return f;
}

Mirror::Mirror(std::string kind, FaceSpec face, const MirrorFrame& frame,
               double thickness, std::string name)
    : Primitive(std::move(name)), kind_(std::move(kind)), frame_(frame), thickness_(thickness) {
    extent_ = frame_extent(frame);
    reach_ = frame_reach(half_x(frame), half_y(frame), frame.decenter_x, frame.decenter_y,
                         face_rotation(face));
    // a sphere curves about a point, cylinders and tori about an axis
    const double half_aperture = (face.family == FaceFamily::Spherical) ? extent_.outer : reach_.across;
    face_ = derive_face(as_convex(std::move(face)), half_aperture);

    const double R = face_.curvature;
    require_geometry(thickness > 0.0, "mirror thickness must be positive");
    require_geometry(thickness < R, "mirror thickness must be smaller than its curvature radius");
    check_curvature_covers(R - thickness, half_aperture);
    if (face_.family == FaceFamily::Toric) {
        check_curvature_covers(face_.major + R - thickness, reach_.along);
    }

    sag_ = deepest(R);
    depth_ = thickness + deepest(R - thickness);
    padding_ = padding_for(depth_);
    // both shell walls end on the plane z=-R; the frame must stay clear of it
    require_geometry(depth_ + padding_ < R, "mirror frame reaches the base of its curved shell");

    solid_ = build();
    solid_->set_parent(this);
}

double Mirror::deepest(double radius) const {
    auto depth_at = [&](double x, double y) { return cap_depth(face_, radius, x, y); };
    double d;
    if (frame_.shape == FrameShape::Rectangular) {
        // depth grows with |x| and |y|, so the far corner is the deepest point
        d = depth_at(std::abs(frame_.decenter_x) + half_x(frame_),
                     std::abs(frame_.decenter_y) + half_y(frame_));
    } else {
        d = max_on_circle(depth_at, frame_.decenter_x, frame_.decenter_y, half_x(frame_));
    }
    require_geometry(!std::isnan(d), "mirror frame reaches past the edge of its curved face");
    return d;
}

std::shared_ptr<Primitive> Mirror::build() const {
    const double R = face_.curvature;
    const double pad = padding_;
    const double cover = reach_.along + 2.0 * pad;
    const double dx = frame_.decenter_x, dy = frame_.decenter_y;

    auto outer = make_cap_at_origin(face_, R, cover);
    auto inner = make_cap_at_origin(face_, R - thickness_, cover + pad);
    inner->set_transform(xform::translate(0, 0, -thickness_) * inner->transform());
    std::shared_ptr<Primitive> body = Subtract(outer, inner);

    const double bottom = -depth_ - pad;
    std::shared_ptr<Primitive> prism;
    if (frame_.shape == FrameShape::Round) {
        prism = std::make_shared<Cylinder>(0.5 * frame_.diameter, pad - bottom);
        prism->set_transform(xform::translate(dx, dy, bottom));
    } else {
        const double hx = 0.5 * frame_.width, hy = 0.5 * frame_.height;
        prism = std::make_shared<Box>(Point3(dx - hx, dy - hy, bottom), Point3(dx + hx, dy + hy, pad));
    }
    body = Intersect(body, prism);

    if (frame_.aperture > 0.0) {
        auto hole = std::make_shared<Cylinder>(0.5 * frame_.aperture, 2.0 * pad - bottom + pad);
        hole->set_transform(xform::translate(dx, dy, bottom - pad));
        body = Subtract(body, hole);
    }
    return body;
}

HitList Mirror::local_hits(const Ray& r) const {
    return solid_->hit_all(r);
}

bool Mirror::local_contains(const Point3& p) const {
    return solid_->contains(p);
}

BoundingBox Mirror::local_bounds() const {
    return solid_->bounding_box();
}

std::string Mirror::describe() const {
    std::ostringstream os;
    os << kind_ << ' ' << to_string(face_.family) << "(R=" << face_.curvature;
    if (face_.family == FaceFamily::Toric) os << ", major=" << face_.major;
    if (face_.rotation_deg != 0.0) os << ", rot=" << face_.rotation_deg;
    os << ") frame=";
    if (frame_.shape == FrameShape::Round) os << "round d=" << frame_.diameter;
    else os << "rect " << frame_.width << 'x' << frame_.height;
    if (frame_.aperture > 0.0) os << " hole=" << frame_.aperture;
    os << " extent=[" << extent_.inner << ", " << extent_.outer << "] sag=" << sag_
       << " t=" << thickness_;
    return os.str();
}

SphericalMirror::SphericalMirror(double curvature, const MirrorFrame& frame,
                                 double thickness, std::string name)
    : Mirror(frame.shape == FrameShape::Round ? "RoundSphericalMirror" : "RectangularSphericalMirror",
             FaceSpec::spherical(FaceShape::Convex, curvature), frame, thickness, std::move(name)) {}

CylindricalMirror::CylindricalMirror(double curvature, const MirrorFrame& frame, bool horizontal,
                                     double thickness, std::string name)
    : Mirror("CylindricalMirror", FaceSpec::cylindrical(FaceShape::Convex, curvature, horizontal),
             frame, thickness, std::move(name)) {}

namespace {

FaceSpec toric_mirror_face(double vertical, double horizontal, double tolerance) {
    FaceSpec f = FaceSpec::toric(FaceShape::Convex, vertical, horizontal);
    f.root_tolerance = tolerance;
    return f;
}

} // anon

ToricMirror::ToricMirror(double vertical, double horizontal, const MirrorFrame& frame,
                         double thickness, std::string name, double root_tolerance)
    : Mirror("ToricMirror", toric_mirror_face(vertical, horizontal, root_tolerance),
             frame, thickness, std::move(name)) {}
