#include "lens.h"
#include "csg.h"
#include "solids.h"
#include "transform.h"

#include <sstream>

namespace {

constexpr double kBackOutward = -1.0;
constexpr double kFrontOutward = 1.0;

/// Axial depth the back face adds below z=0.
double below_back(const FaceGeometry& back) {
    return back.shape == FaceShape::Concave ? back.sag : 0.0;
}

/// Axial depth the front face adds above the front vertex.
double above_front(const FaceGeometry& front) {
    return front.shape == FaceShape::Concave ? front.sag : 0.0;
}

bool is_convex(const FaceGeometry& f) { return f.shape == FaceShape::Convex; }
bool is_flat(const FaceGeometry& f) { return f.shape == FaceShape::Flat; }

void describe_face(std::ostream& os, const char* label, const FaceGeometry& f) {
    os << label << '=' << to_string(f.shape);
    if (f.shape == FaceShape::Flat) return;
    os << ' ' << to_string(f.family) << "(R=" << f.curvature;
    if (f.family == FaceFamily::Toric) os << ", major=" << f.major;
    if (f.rotation_deg != 0.0) os << ", rot=" << f.rotation_deg;
    os << ", sag=" << f.sag << ')';
}

} // anon

Lens::Lens(std::string kind, double diameter, double center_thickness,
           const FaceSpec& back, const FaceSpec& front, std::string name)
    : Primitive(std::move(name)), kind_(std::move(kind)),
      diameter_(diameter), center_thickness_(center_thickness) {
    require_geometry(diameter > 0.0, "lens diameter must be positive");
    require_geometry(center_thickness > 0.0, "lens center thickness must be positive");

    const double half_aperture = 0.5 * diameter;
    back_ = derive_face(back, half_aperture);
    front_ = derive_face(front, half_aperture);
    edge_thickness_ = ::edge_thickness(center_thickness, front_.shape, front_.sag,
                                       back_.shape, back_.sag);

    z_min_ = -below_back(back_);
    z_max_ = center_thickness + above_front(front_);
    const double axial = z_max_ - z_min_;
    padding_ = padding_for(axial);

    short_ = true;
    for (const FaceGeometry* f : {&back_, &front_}) {
        if (is_convex(*f) && !(axial < f->chord_depth)) short_ = false;
    }

    solid_ = short_ ? build_short() : build_long();
    solid_->set_parent(this);
}

std::shared_ptr<Primitive> Lens::barrel(double lo, double hi) const {
    auto bar = std::make_shared<Cylinder>(0.5 * diameter_, hi - lo);
    bar->set_transform(xform::translate(0, 0, lo));
    return bar;
}

std::shared_ptr<Primitive> Lens::carve(std::shared_ptr<Primitive> body) const {
    const double cover = 0.5 * diameter_ + 2.0 * padding_;
    if (back_.shape == FaceShape::Concave) {
        body = Subtract(body, make_face_solid(back_, kBackOutward, 0.0, cover));
    }
    if (front_.shape == FaceShape::Concave) {
        body = Subtract(body, make_face_solid(front_, kFrontOutward, center_thickness_, cover));
    }
    return body;
}

std::shared_ptr<Primitive> Lens::build_short() const {
    const double cover = 0.5 * diameter_ + 2.0 * padding_;
    // a flat face is the barrel end itself
    const double lo = is_flat(back_) ? 0.0 : z_min_ - padding_;
    const double hi = is_flat(front_) ? center_thickness_ : z_max_ + padding_;
    std::shared_ptr<Primitive> body = barrel(lo, hi);
    if (is_convex(back_)) {
        body = Intersect(body, make_face_solid(back_, kBackOutward, 0.0, cover));
    }
    if (is_convex(front_)) {
        body = Intersect(body, make_face_solid(front_, kFrontOutward, center_thickness_, cover));
    }
    return carve(body);
}

std::shared_ptr<Primitive> Lens::build_long() const {
    const double cover = 0.5 * diameter_ + 2.0 * padding_;
    const double pad = padding_;

    // straight section reaches pad into each convex cap slab
    double lo = is_convex(back_) ? back_.sag - pad : z_min_ - pad;
    double hi = is_convex(front_) ? center_thickness_ - front_.sag + pad : z_max_ + pad;
    if (is_flat(back_)) lo = 0.0;
    if (is_flat(front_)) hi = center_thickness_;
    std::shared_ptr<Primitive> body = barrel(lo, hi);

    if (is_convex(back_)) {
        auto cap = Intersect(make_face_solid(back_, kBackOutward, 0.0, cover),
                             barrel(-pad, back_.sag));
        body = Union(body, cap);
    }
    if (is_convex(front_)) {
        auto cap = Intersect(make_face_solid(front_, kFrontOutward, center_thickness_, cover),
                             barrel(center_thickness_ - front_.sag, center_thickness_ + pad));
        body = Union(body, cap);
    }
    return carve(body);
}

HitList Lens::local_hits(const Ray& r) const {
    return solid_->hit_all(r);
}

bool Lens::local_contains(const Point3& p) const {
    return solid_->contains(p);
}

BoundingBox Lens::local_bounds() const {
    return solid_->bounding_box();
}

std::string Lens::describe() const {
    std::ostringstream os;
    os << kind_ << " d=" << diameter_ << " ct=" << center_thickness_
       << " edge=" << edge_thickness_ << ' ';
    describe_face(os, "back", back_);
    os << ' ';
    describe_face(os, "front", front_);
    os << (short_ ? " short" : " long");
    return os.str();
}

// ---------------- spherical ----------------

BiConvex::BiConvex(double diameter, double center_thickness,
                   double front_curvature, double back_curvature, std::string name)
    : Lens("BiConvex", diameter, center_thickness,
           FaceSpec::spherical(FaceShape::Convex, back_curvature),
           FaceSpec::spherical(FaceShape::Convex, front_curvature), std::move(name)) {}

BiConcave::BiConcave(double diameter, double center_thickness,
                     double front_curvature, double back_curvature, std::string name)
    : Lens("BiConcave", diameter, center_thickness,
           FaceSpec::spherical(FaceShape::Concave, back_curvature),
           FaceSpec::spherical(FaceShape::Concave, front_curvature), std::move(name)) {}

Meniscus::Meniscus(double diameter, double center_thickness,
                   double front_curvature, double back_curvature, std::string name)
    : Lens("Meniscus", diameter, center_thickness,
           FaceSpec::spherical(FaceShape::Concave, back_curvature),
           FaceSpec::spherical(FaceShape::Convex, front_curvature), std::move(name)) {}

PlanoConvex::PlanoConvex(double diameter, double center_thickness, double curvature, std::string name)
    : Lens("PlanoConvex", diameter, center_thickness, FaceSpec::flat(),
           FaceSpec::spherical(FaceShape::Convex, curvature), std::move(name)) {}

PlanoConcave::PlanoConcave(double diameter, double center_thickness, double curvature, std::string name)
    : Lens("PlanoConcave", diameter, center_thickness, FaceSpec::flat(),
           FaceSpec::spherical(FaceShape::Concave, curvature), std::move(name)) {}

// ---------------- cylindrical ----------------

CylindricalBiConvex::CylindricalBiConvex(double diameter, double center_thickness,
                                         double front_curvature, double back_curvature,
                                         bool horizontal, std::string name)
    : Lens("CylindricalBiConvex", diameter, center_thickness,
           FaceSpec::cylindrical(FaceShape::Convex, back_curvature, horizontal),
           FaceSpec::cylindrical(FaceShape::Convex, front_curvature, horizontal), std::move(name)) {}

CylindricalBiConcave::CylindricalBiConcave(double diameter, double center_thickness,
                                           double front_curvature, double back_curvature,
                                           bool horizontal, std::string name)
    : Lens("CylindricalBiConcave", diameter, center_thickness,
           FaceSpec::cylindrical(FaceShape::Concave, back_curvature, horizontal),
           FaceSpec::cylindrical(FaceShape::Concave, front_curvature, horizontal), std::move(name)) {}

CylindricalMeniscus::CylindricalMeniscus(double diameter, double center_thickness,
                                         double front_curvature, double back_curvature,
                                         bool horizontal, std::string name)
    : Lens("CylindricalMeniscus", diameter, center_thickness,
           FaceSpec::cylindrical(FaceShape::Concave, back_curvature, horizontal),
           FaceSpec::cylindrical(FaceShape::Convex, front_curvature, horizontal), std::move(name)) {}

CylindricalPlanoConvex::CylindricalPlanoConvex(double diameter, double center_thickness,
                                               double curvature, bool horizontal, std::string name)
    : Lens("CylindricalPlanoConvex", diameter, center_thickness, FaceSpec::flat(),
           FaceSpec::cylindrical(FaceShape::Convex, curvature, horizontal), std::move(name)) {}

CylindricalPlanoConcave::CylindricalPlanoConcave(double diameter, double center_thickness,
                                                 double curvature, bool horizontal, std::string name)
    : Lens("CylindricalPlanoConcave", diameter, center_thickness, FaceSpec::flat(),
           FaceSpec::cylindrical(FaceShape::Concave, curvature, horizontal), std::move(name)) {}

// ---------------- toric ----------------

namespace {

FaceSpec toric_spec(FaceShape shape, double vertical, double horizontal, double tolerance) {
    FaceSpec f = FaceSpec::toric(shape, vertical, horizontal);
    f.root_tolerance = tolerance;
    return f;
}

} // anon

ToricBiConvex::ToricBiConvex(double diameter, double center_thickness,
                             double front_vertical, double front_horizontal,
                             double back_vertical, double back_horizontal,
                             std::string name, double root_tolerance)
    : Lens("ToricBiConvex", diameter, center_thickness,
           toric_spec(FaceShape::Convex, back_vertical, back_horizontal, root_tolerance),
           toric_spec(FaceShape::Convex, front_vertical, front_horizontal, root_tolerance),
           std::move(name)) {}

ToricBiConcave::ToricBiConcave(double diameter, double center_thickness,
                               double front_vertical, double front_horizontal,
                               double back_vertical, double back_horizontal,
                               std::string name, double root_tolerance)
    : Lens("ToricBiConcave", diameter, center_thickness,
           toric_spec(FaceShape::Concave, back_vertical, back_horizontal, root_tolerance),
           toric_spec(FaceShape::Concave, front_vertical, front_horizontal, root_tolerance),
           std::move(name)) {}

ToricMeniscus::ToricMeniscus(double diameter, double center_thickness,
                             double front_vertical, double front_horizontal,
                             double back_vertical, double back_horizontal,
                             std::string name, double root_tolerance)
    : Lens("ToricMeniscus", diameter, center_thickness,
           toric_spec(FaceShape::Concave, back_vertical, back_horizontal, root_tolerance),
           toric_spec(FaceShape::Convex, front_vertical, front_horizontal, root_tolerance),
           std::move(name)) {}

ToricPlanoConvex::ToricPlanoConvex(double diameter, double center_thickness,
                                   double vertical, double horizontal,
                                   std::string name, double root_tolerance)
    : Lens("ToricPlanoConvex", diameter, center_thickness, FaceSpec::flat(),
           toric_spec(FaceShape::Convex, vertical, horizontal, root_tolerance), std::move(name)) {}

ToricPlanoConcave::ToricPlanoConcave(double diameter, double center_thickness,
                                     double vertical, double horizontal,
                                     std::string name, double root_tolerance)
    : Lens("ToricPlanoConcave", diameter, center_thickness, FaceSpec::flat(),
           toric_spec(FaceShape::Concave, vertical, horizontal, root_tolerance), std::move(name)) {}
