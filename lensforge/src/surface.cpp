#include "surface.h"

#include <cmath>

SurfaceClass classify_surface(const SurfaceDesc& s) {
    SurfaceClass c;
    c.shape = (s.aperture && s.rectangular_aperture) ? ShapeType::Rectangular : ShapeType::Round;

    if (s.kind == SurfaceKind::Standard) {
        c.type = (s.radius == 0.0) ? SurfaceType::Flat : SurfaceType::Spherical;
        return c;
    }

    const double rv = std::abs(s.radius);
    const double rh = std::abs(s.radius_horizontal);
    if (rv == 0.0 && rh == 0.0) {
        c.type = SurfaceType::Flat;
    } else if (rv == 0.0 || rh == 0.0) {
        c.type = SurfaceType::Cylindrical;
    } else if (std::abs(rv - rh) < kRadiusEqualTolerance) {
        c.type = SurfaceType::Spherical;
    } else {
        c.type = SurfaceType::Toroidal;
    }
    return c;
}

const char* to_string(SurfaceType type) {
    switch (type) {
        case SurfaceType::Flat:        return "flat";
        case SurfaceType::Cylindrical: return "cylindrical";
        case SurfaceType::Spherical:   return "spherical";
        case SurfaceType::Toroidal:    return "toroidal";
    }
    return "unknown";
}

const char* to_string(ShapeType shape) {
    switch (shape) {
        case ShapeType::Round:       return "round";
        case ShapeType::Rectangular: return "rectangular";
    }
    return "unknown";
}
