#include "faces.h"
#include "segments.h"
#include "solids.h"
#include "torus.h"
#include "transform.h"

#include <cmath>
#include <limits>

const char* to_string(FaceFamily family) {
    switch (family) {
        case FaceFamily::Spherical:   return "spherical";
        case FaceFamily::Cylindrical: return "cylindrical";
        case FaceFamily::Toric:       return "toric";
    }
    return "unknown";
}

FaceSpec FaceSpec::flat() {
    return FaceSpec{};
}

FaceSpec FaceSpec::spherical(FaceShape shape, double curvature) {
    FaceSpec f;
    f.shape = shape;
    f.family = FaceFamily::Spherical;
    f.curvature = curvature;
    return f;
}

FaceSpec FaceSpec::cylindrical(FaceShape shape, double curvature, bool horizontal) {
    FaceSpec f;
    f.shape = shape;
    f.family = FaceFamily::Cylindrical;
    f.curvature = curvature;
    f.horizontal = horizontal;
    return f;
}

FaceSpec FaceSpec::toric(FaceShape shape, double vertical, double horizontal) {
    FaceSpec f;
    f.shape = shape;
    f.family = FaceFamily::Toric;
    f.curvature = vertical;
    f.curvature_horizontal = horizontal;
    return f;
}

FaceGeometry derive_face(const FaceSpec& spec, double half_aperture) {
    FaceGeometry g;
    g.shape = spec.shape;
    g.family = spec.family;
    g.root_tolerance = spec.root_tolerance;
    if (spec.shape == FaceShape::Flat) return g;

    switch (spec.family) {
        case FaceFamily::Spherical:
            g.curvature = spec.curvature;
            g.sag = cap_sag(spec.curvature, half_aperture);
            // full ball: chord through the rim on both sides of the centre
            g.chord_depth = 2.0 * (g.curvature - g.sag);
            break;
        case FaceFamily::Cylindrical:
            g.curvature = spec.curvature;
            g.rotation_deg = face_rotation(spec);
            g.sag = cap_sag(spec.curvature, half_aperture);
            g.chord_depth = g.curvature - g.sag;
            break;
        case FaceFamily::Toric: {
            const ToricFace t = toric_face(spec.curvature, spec.curvature_horizontal, half_aperture);
            g.curvature = t.minor;
            g.major = t.major;
            g.rotation_deg = t.rotation_deg;
            g.sag = t.sag;
            g.chord_depth = g.curvature - g.sag;
            break;
        }
    }
    return g;
}

double face_rotation(const FaceSpec& spec) {
    switch (spec.family) {
        case FaceFamily::Spherical:   return 0.0;
        case FaceFamily::Cylindrical: return spec.horizontal ? 90.0 : 0.0;
        case FaceFamily::Toric:       return (spec.curvature <= spec.curvature_horizontal) ? 0.0 : 90.0;
    }
    return 0.0;
}

double cap_depth(const FaceGeometry& face, double radius, double x, double y) {
    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
    // u runs along the curvature axis of the cap, v across it
    const double u = (face.rotation_deg != 0.0) ? y : x;
    const double v = (face.rotation_deg != 0.0) ? x : y;
    const double r2 = radius * radius;

    switch (face.family) {
        case FaceFamily::Spherical: {
            const double rho2 = u * u + v * v;
            if (rho2 > r2) return kNaN;
            return radius - std::sqrt(r2 - rho2);
        }
        case FaceFamily::Cylindrical:
            if (v * v > r2) return kNaN;
            return radius - std::sqrt(r2 - v * v);
        case FaceFamily::Toric: {
            if (v * v > r2) return kNaN;
            // distance from the revolution axis of the tube section through v
            const double q = face.major + std::sqrt(r2 - v * v);
            if (u * u > q * q) return kNaN;
            return face.major + radius - std::sqrt(q * q - u * u);
        }
    }
    return kNaN;
}

std::shared_ptr<Primitive> make_cap_at_origin(const FaceGeometry& face, double radius,
                                              double cover_half_width) {
    std::shared_ptr<Primitive> cap;
    switch (face.family) {
        case FaceFamily::Spherical:
            cap = std::make_shared<SphereSegment>(radius, radius);
            break;
        case FaceFamily::Cylindrical:
            cap = std::make_shared<CylinderSegment>(radius, radius, 2.0 * cover_half_width);
            break;
        case FaceFamily::Toric:
            cap = std::make_shared<TorusSegment>(face.major, radius, radius, std::string{},
                                                 face.root_tolerance);
            break;
    }
    cap->set_transform(xform::rotate_z(face.rotation_deg) * xform::translate(0, 0, -radius));
    return cap;
}

std::shared_ptr<Primitive> make_face_solid(const FaceGeometry& face, double outward,
                                           double vertex_z, double cover_half_width) {
    require_geometry(face.shape != FaceShape::Flat, "a flat face has no bounding solid");
    const double R = face.curvature;
    const double pointing = (face.shape == FaceShape::Convex) ? outward : -outward;

    if (face.family == FaceFamily::Spherical) {
        auto ball = std::make_shared<Sphere>(R);
        ball->set_transform(xform::translate(0, 0, vertex_z - pointing * R));
        return ball;
    }

    auto cap = make_cap_at_origin(face, R, cover_half_width);
    Matrix4 place = xform::translate(0, 0, vertex_z);
    if (pointing < 0.0) place = place * xform::rotate_x(180.0);
    cap->set_transform(place * cap->transform());
    return cap;
}
