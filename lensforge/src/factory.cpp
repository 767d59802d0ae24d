#include "factory.h"
#include "flat.h"
#include "lens.h"
#include "mirror.h"
#include "solids.h"
#include "transform.h"

#include <cmath>
#include <iostream>
#include <sstream>

namespace {

/// Curvature of one lens face after resolving the surface family.
struct FaceSelection {
    SurfaceType type{SurfaceType::Flat};
    ShapeType shape{ShapeType::Round};
    /// Radius sign times propagation direction.
    int sign{0};
    double curvature{0.0};
    double curvature_horizontal{0.0};
    bool horizontal{false};
};

enum class LensVariant { BiConvex, BiConcave, Meniscus, PlanoConvex, PlanoConcave };

std::string describe_surface(const SurfaceDesc& s) {
    std::ostringstream os;
    os << "surface '" << s.name << "' (R=" << s.radius;
    if (s.kind == SurfaceKind::Toroidal) os << ", Rh=" << s.radius_horizontal;
    os << ", semi-diameter=" << s.semi_diameter << ")";
    return os.str();
}

[[noreturn]] void reject(const std::string& what, const SurfaceDesc& s, const std::string& why) {
    throw CannotCreatePrimitive("Cannot create " + what + " from " + describe_surface(s) + ": " + why);
}

void check_for_small_numbers(const std::string& what, const SurfaceDesc& s) {
    if (s.semi_diameter < kMinimumDimension) reject(what, s, "semi-diameter is too small");
    if (s.thickness > 0.0 && s.thickness < kMinimumDimension) reject(what, s, "thickness is too small");
}

FaceSelection select_face(const std::string& what, const SurfaceDesc& s, int direction) {
    const SurfaceClass cls = classify_surface(s);
    FaceSelection f;
    f.type = cls.type;
    f.shape = cls.shape;

    switch (cls.type) {
        case SurfaceType::Flat:
            return f;
        case SurfaceType::Spherical:
            f.curvature = std::abs(s.radius);
            f.sign = sign_of(s.radius) * direction;
            return f;
        case SurfaceType::Cylindrical: {
            f.horizontal = (s.radius_horizontal != 0.0);
            const double r = f.horizontal ? s.radius_horizontal : s.radius;
            f.curvature = std::abs(r);
            f.sign = sign_of(r) * direction;
            return f;
        }
        case SurfaceType::Toroidal:
            if (sign_of(s.radius) != sign_of(s.radius_horizontal)) {
                reject(what, s, "toric radii of opposite signs are not supported");
            }
            f.curvature = std::abs(s.radius);
            f.curvature_horizontal = std::abs(s.radius_horizontal);
            f.sign = sign_of(s.radius) * direction;
            return f;
    }
    return f;
}

std::shared_ptr<Lens> make_spherical(LensVariant v, double d, double ct,
                                     const FaceSelection& front, const FaceSelection& back,
                                     const std::string& name) {
    switch (v) {
        case LensVariant::BiConvex:     return std::make_shared<BiConvex>(d, ct, front.curvature, back.curvature, name);
        case LensVariant::BiConcave:    return std::make_shared<BiConcave>(d, ct, front.curvature, back.curvature, name);
        case LensVariant::Meniscus:     return std::make_shared<Meniscus>(d, ct, front.curvature, back.curvature, name);
        case LensVariant::PlanoConvex:  return std::make_shared<PlanoConvex>(d, ct, front.curvature, name);
        case LensVariant::PlanoConcave: return std::make_shared<PlanoConcave>(d, ct, front.curvature, name);
    }
    return nullptr;
}

std::shared_ptr<Lens> make_cylindrical(LensVariant v, double d, double ct,
                                       const FaceSelection& front, const FaceSelection& back,
                                       bool horizontal, const std::string& name) {
    switch (v) {
        case LensVariant::BiConvex:
            return std::make_shared<CylindricalBiConvex>(d, ct, front.curvature, back.curvature, horizontal, name);
        case LensVariant::BiConcave:
            return std::make_shared<CylindricalBiConcave>(d, ct, front.curvature, back.curvature, horizontal, name);
        case LensVariant::Meniscus:
            return std::make_shared<CylindricalMeniscus>(d, ct, front.curvature, back.curvature, horizontal, name);
        case LensVariant::PlanoConvex:
            return std::make_shared<CylindricalPlanoConvex>(d, ct, front.curvature, horizontal, name);
        case LensVariant::PlanoConcave:
            return std::make_shared<CylindricalPlanoConcave>(d, ct, front.curvature, horizontal, name);
    }
    return nullptr;
}

std::shared_ptr<Lens> make_toric(LensVariant v, double d, double ct,
                                 const FaceSelection& front, const FaceSelection& back,
                                 const std::string& name, double tol) {
    switch (v) {
        case LensVariant::BiConvex:
            return std::make_shared<ToricBiConvex>(d, ct, front.curvature, front.curvature_horizontal,
                                                   back.curvature, back.curvature_horizontal, name, tol);
        case LensVariant::BiConcave:
            return std::make_shared<ToricBiConcave>(d, ct, front.curvature, front.curvature_horizontal,
                                                    back.curvature, back.curvature_horizontal, name, tol);
        case LensVariant::Meniscus:
            return std::make_shared<ToricMeniscus>(d, ct, front.curvature, front.curvature_horizontal,
                                                   back.curvature, back.curvature_horizontal, name, tol);
        case LensVariant::PlanoConvex:
            return std::make_shared<ToricPlanoConvex>(d, ct, front.curvature, front.curvature_horizontal,
                                                      name, tol);
        case LensVariant::PlanoConcave:
            return std::make_shared<ToricPlanoConcave>(d, ct, front.curvature, front.curvature_horizontal,
                                                       name, tol);
    }
    return nullptr;
}

} // anon

int sign_of(double x) {
    return (x > 0.0) - (x < 0.0);
}

Matrix4 mirror_direction_transform(int direction, int curvature_sign) {
    if (direction * curvature_sign > 0) return xform::rotate_y(180.0);
    return Matrix4();
}

std::shared_ptr<Primitive> create_lens(const SurfaceDesc& back, const SurfaceDesc& front,
                                       int direction, double root_tolerance) {
    const std::string what = "lens";
    check_for_small_numbers(what, back);
    check_for_small_numbers(what, front);

    const FaceSelection b = select_face(what, back, direction);
    const FaceSelection f = select_face(what, front, direction);

    if (b.shape != ShapeType::Round || f.shape != ShapeType::Round) {
        std::cerr << "[warn] lens '" << (back.name.empty() ? front.name : back.name)
                  << "' has a non-round aperture; building it round\n";
    }

    const std::string name = back.name.empty() ? front.name : back.name;
    const double diameter = 2.0 * back.semi_diameter;
    const double ct = std::abs(back.thickness);

    auto material = std::make_shared<Material>();
    if (!back.material.empty()) material->name = back.material;

    // two flat sides: a plain slab
    if (b.sign == 0 && f.sign == 0) {
        const double t = (ct > 0.0) ? ct : kDefaultThickness;
        std::shared_ptr<Primitive> slab;
        try {
            if (b.shape == ShapeType::Rectangular) {
                const double hx = (*back.aperture)[0], hy = (*back.aperture)[1];
                slab = std::make_shared<Box>(Point3(-hx, -hy, 0.0), Point3(hx, hy, t), name);
            } else {
                slab = std::make_shared<Cylinder>(0.5 * diameter, t, name);
            }
        } catch (const GeometryError& e) {
            reject(what, back, e.what());
        }
        slab->set_material(material);
        return slab;
    }
    if (ct <= 0.0) reject(what, back, "center thickness must be positive");

    // family of the curved faces; mixed families are not supported
    SurfaceType family = (b.type != SurfaceType::Flat) ? b.type : f.type;
    if (b.type != SurfaceType::Flat && f.type != SurfaceType::Flat && b.type != f.type) {
        reject(what, back, std::string("cannot pair a ") + to_string(b.type) + " back with a "
                           + to_string(f.type) + " front");
    }
    if (family == SurfaceType::Cylindrical && b.type == f.type && b.horizontal != f.horizontal) {
        reject(what, back, "cylindrical faces must curve in the same plane");
    }
    const bool horizontal = (b.type == SurfaceType::Cylindrical) ? b.horizontal : f.horizontal;

    LensVariant variant;
    bool flipped = false;
    if (b.sign > 0 && f.sign < 0) {
        variant = LensVariant::BiConvex;
    } else if (b.sign < 0 && f.sign > 0) {
        variant = LensVariant::BiConcave;
    } else if (b.sign < 0 && f.sign < 0) {
        variant = LensVariant::Meniscus;
    } else if (b.sign > 0 && f.sign > 0) {
        variant = LensVariant::Meniscus;
        flipped = true;
    } else if (b.sign == 0) {
        variant = (f.sign < 0) ? LensVariant::PlanoConvex : LensVariant::PlanoConcave;
    } else {
        variant = (b.sign > 0) ? LensVariant::PlanoConvex : LensVariant::PlanoConcave;
        flipped = true;
    }

    // a flipped lens is built with its faces swapped, then turned around
    const FaceSelection& lens_front = flipped ? b : f;
    const FaceSelection& lens_back = flipped ? f : b;

    std::shared_ptr<Lens> lens;
    try {
        switch (family) {
            case SurfaceType::Flat:
            case SurfaceType::Spherical:
                lens = make_spherical(variant, diameter, ct, lens_front, lens_back, name);
                break;
            case SurfaceType::Cylindrical:
                lens = make_cylindrical(variant, diameter, ct, lens_front, lens_back, horizontal, name);
                break;
            case SurfaceType::Toroidal:
                lens = make_toric(variant, diameter, ct, lens_front, lens_back, name, root_tolerance);
                break;
        }
    } catch (const GeometryError& e) {
        reject(what, back, e.what());
    }

    if (flipped) lens->set_transform(xform::flip(ct));
    lens->set_material(material);
    return lens;
}

std::shared_ptr<Primitive> create_mirror(const SurfaceDesc& surface, int direction,
                                         double root_tolerance) {
    const std::string what = "mirror";
    check_for_small_numbers(what, surface);
    const SurfaceClass cls = classify_surface(surface);

    auto material = std::make_shared<Material>();
    material->name = surface.material.empty() ? "MIRROR" : surface.material;
    material->mirror = true;

    if (cls.type == SurfaceType::Flat) {
        if (cls.shape == ShapeType::Rectangular && surface.aperture_decenter) {
            reject(what, surface, "decentered flat rectangles are not supported");
        }
        std::shared_ptr<Primitive> flat;
        try {
            if (cls.shape == ShapeType::Rectangular) {
                const auto& ap = *surface.aperture;
                flat = std::make_shared<Rectangle>(2.0 * ap[0], 2.0 * ap[1], surface.name);
            } else {
                flat = std::make_shared<Circle>(surface.semi_diameter, surface.name);
            }
        } catch (const GeometryError& e) {
            reject(what, surface, e.what());
        }
        flat->set_material(material);
        return flat;
    }

    MirrorFrame frame;
    if (cls.shape == ShapeType::Rectangular) {
        const auto& ap = *surface.aperture;
        frame = MirrorFrame::rectangular(2.0 * ap[0], 2.0 * ap[1]);
    } else if (surface.aperture) {
        const auto& ap = *surface.aperture;
        frame = MirrorFrame::round(2.0 * ap[1], 2.0 * ap[0]);
    } else {
        frame = MirrorFrame::round(2.0 * surface.semi_diameter);
    }

    int curvature_sign = sign_of(surface.radius);
    double curvature = std::abs(surface.radius);
    bool horizontal = false;
    if (cls.type == SurfaceType::Cylindrical && surface.radius_horizontal != 0.0) {
        horizontal = true;
        curvature_sign = sign_of(surface.radius_horizontal);
        curvature = std::abs(surface.radius_horizontal);
    }
    if (cls.type == SurfaceType::Toroidal && sign_of(surface.radius) != sign_of(surface.radius_horizontal)) {
        reject(what, surface, "toric radii of opposite signs are not supported");
    }

    if (surface.aperture_decenter) {
        frame.decenter_x = (*surface.aperture_decenter)[0];
        frame.decenter_y = (*surface.aperture_decenter)[1];
    }
    if (curvature_sign < 0) frame.decenter_x = -frame.decenter_x;

    std::shared_ptr<Mirror> mirror;
    try {
        switch (cls.type) {
            case SurfaceType::Spherical:
                mirror = std::make_shared<SphericalMirror>(curvature, frame, kDefaultMirrorThickness,
                                                           surface.name);
                break;
            case SurfaceType::Cylindrical:
                mirror = std::make_shared<CylindricalMirror>(curvature, frame, horizontal,
                                                             kDefaultMirrorThickness, surface.name);
                break;
            case SurfaceType::Toroidal:
                mirror = std::make_shared<ToricMirror>(curvature, std::abs(surface.radius_horizontal), frame,
                                                       kDefaultMirrorThickness, surface.name, root_tolerance);
                break;
            case SurfaceType::Flat:
                break;
        }
    } catch (const GeometryError& e) {
        reject(what, surface, e.what());
    }

    mirror->set_transform(mirror_direction_transform(direction, curvature_sign));
    mirror->set_material(material);
    return mirror;
}
