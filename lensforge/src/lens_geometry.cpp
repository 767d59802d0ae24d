#include "lens_geometry.h"
#include "geometry.h"

#include <cmath>
#include <sstream>

const char* to_string(FaceShape shape) {
    switch (shape) {
        case FaceShape::Flat:    return "flat";
        case FaceShape::Convex:  return "convex";
        case FaceShape::Concave: return "concave";
    }
    return "unknown";
}

double cap_sag(double curvature, double half_aperture) {
    require_geometry(curvature > 0.0, "curvature radius must be positive");
    require_geometry(half_aperture > 0.0, "aperture must be positive");
    if (curvature < half_aperture) {
        std::ostringstream msg;
        msg << "curvature radius " << curvature << " is smaller than half-aperture " << half_aperture;
        throw GeometryError(msg.str());
    }
    return curvature - std::sqrt(curvature * curvature - half_aperture * half_aperture);
}

ToricFace toric_face(double vertical, double horizontal, double half_aperture) {
    require_geometry(vertical > 0.0 && horizontal > 0.0, "toric curvatures must be positive");
    require_geometry(std::abs(vertical - horizontal) >= kSmallNumber,
                     "toric curvatures are equal; use a spherical face");
    ToricFace face;
    face.minor = std::min(vertical, horizontal);
    face.major = std::abs(vertical - horizontal);
    face.rotation_deg = (vertical <= horizontal) ? 0.0 : 90.0;
    face.sag = cap_sag(face.minor, half_aperture);
    return face;
}

double edge_thickness(double center_thickness,
                      FaceShape front, double front_sag,
                      FaceShape back, double back_sag) {
    auto contribution = [](FaceShape shape, double sag) {
        switch (shape) {
            case FaceShape::Convex:  return sag;
            case FaceShape::Concave: return -sag;
            case FaceShape::Flat:    return 0.0;
        }
        return 0.0;
    };
    const double edge = center_thickness - contribution(front, front_sag) - contribution(back, back_sag);
    if (edge < 0.0) {
        std::ostringstream msg;
        msg << "edge thickness is negative (" << edge << "): center thickness " << center_thickness
            << " cannot hold a " << to_string(front) << " front and " << to_string(back) << " back";
        throw GeometryError(msg.str());
    }
    return edge;
}

FrameExtent round_frame_extent(double diameter, double aperture,
                               double decenter_x, double decenter_y) {
    require_geometry(diameter > 0.0, "mirror diameter must be positive");
    require_geometry(aperture >= 0.0, "mirror aperture must not be negative");
    require_geometry(aperture < diameter, "mirror aperture must be smaller than the frame");

    const double offset = std::hypot(decenter_x, decenter_y);
    const double frame_r = 0.5 * diameter;
    const double hole_r = 0.5 * aperture;

    FrameExtent ext;
    ext.outer = offset + frame_r;
    if (offset >= frame_r) {
        ext.inner = offset - frame_r;
    } else if (offset < hole_r) {
        ext.inner = hole_r - offset;
    }
    return ext;
}

FrameExtent rect_frame_extent(double width, double height, double aperture,
                              double decenter_x, double decenter_y) {
    require_geometry(width > 0.0 && height > 0.0, "mirror width and height must be positive");
    require_geometry(aperture >= 0.0, "mirror aperture must not be negative");
    require_geometry(aperture < std::min(width, height), "mirror aperture must be smaller than the frame");

    const double hx = 0.5 * width, hy = 0.5 * height;
    const double ax = std::abs(decenter_x), ay = std::abs(decenter_y);

    FrameExtent ext;
    ext.outer = std::hypot(ax + hx, ay + hy);

    // distance from the axis to the rectangle (zero when the axis is inside)
    const double gx = std::max(0.0, ax - hx);
    const double gy = std::max(0.0, ay - hy);
    ext.inner = std::hypot(gx, gy);

    const double offset = std::hypot(decenter_x, decenter_y);
    if (ext.inner == 0.0 && offset < 0.5 * aperture) {
        ext.inner = 0.5 * aperture - offset;
    }
    return ext;
}

FrameReach frame_reach(double half_x, double half_y,
                       double decenter_x, double decenter_y, double rotation_deg) {
    const double reach_x = std::abs(decenter_x) + half_x;
    const double reach_y = std::abs(decenter_y) + half_y;
    FrameReach r;
    r.across = (rotation_deg != 0.0) ? reach_x : reach_y;
    r.along = (rotation_deg != 0.0) ? reach_y : reach_x;
    return r;
}

void check_curvature_covers(double curvature, double outer) {
    if (curvature < outer) {
        std::ostringstream msg;
        msg << "curvature radius " << curvature << " does not reach the frame edge at " << outer;
        throw GeometryError(msg.str());
    }
}
