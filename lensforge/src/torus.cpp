#include "torus.h"
#include "span.h"

#include <array>
#include <cmath>
#include <complex>

TorusSegment::TorusSegment(double major, double minor, double height, std::string name,
                           double root_tolerance)
    : Primitive(std::move(name)), major_(major), minor_(minor), height_(height),
      root_tolerance_(root_tolerance), axis_z_(height - major - minor) {
    require_geometry(major > 0.0, "torus segment major radius must be positive");
    require_geometry(minor > 0.0, "torus segment minor radius must be positive");
    require_geometry(height > 0.0, "torus segment height must be positive");
    require_geometry(height <= minor, "torus segment height exceeds its minor radius");
    require_geometry(root_tolerance > 0.0, "root tolerance must be positive");
}

double TorusSegment::base_half_width() const {
    const double outer = major_ + minor_;
    const double c = outer - height_;
    return std::sqrt(std::max(0.0, outer * outer - c * c));
}

double TorusSegment::base_half_depth() const {
    const double c = minor_ - height_;
    return std::sqrt(std::max(0.0, minor_ * minor_ - c * c));
}

double TorusSegment::implicit(const Point3& p) const {
    const double x = p.x, y = p.y, z = p.z - axis_z_;
    const double a2 = major_ * major_;
    const double s = x*x + y*y + z*z + a2 - minor_ * minor_;
    return s * s - 4.0 * a2 * (x*x + z*z);
}

bool TorusSegment::in_tube(const Point3& p) const {
    const double z = p.z - axis_z_;
    const double rho = std::sqrt(p.x * p.x + z * z) - major_;
    return rho * rho + p.y * p.y <= minor_ * minor_;
}

bool TorusSegment::on_outer_sheet(const Point3& p) const {
    // The quartic factors into (outer sheet)·(inner sheet); the inner factor exceeds the
    // outer one by 4·major·rho, so a root belongs to whichever factor is closer to zero.
    const double z = p.z - axis_z_;
    const double rho = std::sqrt(p.x * p.x + z * z);
    const double outer = (rho - major_) * (rho - major_) + p.y * p.y - minor_ * minor_;
    return outer >= -2.0 * major_ * rho;
}

Dir3 TorusSegment::gradient_normal(const Point3& p) const {
    const double x = p.x, y = p.y, z = p.z - axis_z_;
    const double a2 = major_ * major_;
    const double s = x*x + y*y + z*z + a2 - minor_ * minor_;
    return Dir3(4.0 * s * x - 8.0 * a2 * x,
                4.0 * s * y,
                4.0 * s * z - 8.0 * a2 * z).normalized();
}

HitList TorusSegment::local_hits(const Ray& r) const {
    // Work relative to the torus centre, starting from the ray's closest approach to it.
    const Point3 centre(0, 0, axis_z_);
    const double t_shift = (centre - r.o).dot(r.d);
    const Point3 o = r.at(t_shift);
    const double ox = o.x, oy = o.y, oz = o.z - axis_z_;
    const double dx = r.d.x, dy = r.d.y, dz = r.d.z;

    const double R2 = major_ * major_;
    const double r2 = minor_ * minor_;
    const double alpha = dx*dx + dy*dy + dz*dz;
    const double beta = ox*dx + oy*dy + oz*dz;
    const double gamma = ox*ox + oy*oy + oz*oz;
    const double xi = R2 - r2;
    const double iota = R2 + r2;

    const double c4 = alpha * alpha;
    const double c3 = 4.0 * alpha * beta;
    const double c2 = 2.0 * alpha * (gamma + xi) - 4.0 * R2 * (dx*dx + dz*dz) + 4.0 * beta * beta;
    const double c1 = 8.0 * R2 * oy * dy + 4.0 * beta * (gamma - iota);
    const double c0 = gamma * gamma + xi * xi - 2.0 * ((ox*ox + oz*oz) * iota - oy*oy * xi);

    std::array<std::complex<double>, 4> roots;
    solve_quartic(c4, c3, c2, c1, c0, roots, root_tolerance_);

    double near = 0.0, far = 0.0;
    if (!pick_two_roots(roots, near, far, root_tolerance_)) return {};

    // Rays crossing the far side of the ring produce four real roots; every root
    // at or above the base belongs to the cap.
    std::array<double, 4> real{};
    const int count = collect_real_roots(roots, real, root_tolerance_);

    Span s = Span::none();
    auto accept = [&s](double t, const Dir3& n) {
        if (s.empty) {
            s = Span();
            s.t0 = s.t1 = t;
            s.n0 = s.n1 = n;
            return;
        }
        if (t < s.t0) { s.t0 = t; s.n0 = n; }
        if (t > s.t1) { s.t1 = t; s.n1 = n; }
    };

    bool base_needed = false;
    for (int i = 0; i < count; ++i) {
        const double t = t_shift + real[i];
        const Point3 p = r.at(t);
        if (p.z >= 0.0) {
            if (on_outer_sheet(p)) accept(t, gradient_normal(p));
        } else if (real[i] == near || real[i] == far) {
            base_needed = true;
        }
    }

    if (base_needed && r.d.z != 0.0) {
        const double tb = -r.o.z / r.d.z;
        const Point3 pb(r.o.x + r.d.x * tb, r.o.y + r.d.y * tb, 0.0);
        if (in_tube(pb)) accept(tb, Dir3(0, 0, -1));
    }

    return span_hits(r, s, this);
}

bool TorusSegment::local_contains(const Point3& p) const {
    return p.z >= 0.0 && in_tube(p);
}

BoundingBox TorusSegment::local_bounds() const {
    const double bx = base_half_width();
    const double by = base_half_depth();
    return BoundingBox(Point3(-bx, -by, 0.0), Point3(bx, by, height_)).padded(kBoxPadding);
}
