#include "span.h"
#include <cmath>

namespace {

inline double comp(const Vec4& v, int axis) {
    return axis == 0 ? v.x : (axis == 1 ? v.y : v.z);
}

} // anon

Dir3 axis_dir(int axis, double sign) {
    switch (axis) {
        case 0: return Dir3(sign, 0, 0);
        case 1: return Dir3(0, sign, 0);
        default: return Dir3(0, 0, sign);
    }
}

Span span_intersect(const Span& a, const Span& b) {
    if (a.empty || b.empty) return Span::none();
    Span s = a;
    if (b.t0 > s.t0) { s.t0 = b.t0; s.n0 = b.n0; }
    if (b.t1 < s.t1) { s.t1 = b.t1; s.n1 = b.n1; }
    if (s.t0 > s.t1) return Span::none();
    return s;
}

Span slab_span(const Ray& r, int axis, double lo, double hi) {
    const double o = comp(r.o, axis);
    const double d = comp(r.d, axis);
    if (d == 0.0) {
        if (o < lo || o > hi) return Span::none();
        return Span();
    }
    const double ta = (lo - o) / d;
    const double tb = (hi - o) / d;
    Span s;
    if (d > 0.0) {
        s.t0 = ta; s.n0 = axis_dir(axis, -1.0);
        s.t1 = tb; s.n1 = axis_dir(axis, 1.0);
    } else {
        s.t0 = tb; s.n0 = axis_dir(axis, 1.0);
        s.t1 = ta; s.n1 = axis_dir(axis, -1.0);
    }
    return s;
}

Span ball_span(const Ray& r, const Point3& c, double radius) {
    // |o + t d - c|^2 = R^2 with |d| = 1
    const Dir3 oc = Dir3(r.o.x - c.x, r.o.y - c.y, r.o.z - c.z);
    const double half_b = oc.dot(r.d);
    const double cterm = oc.dot(oc) - radius * radius;
    const double disc = half_b * half_b - cterm;
    if (disc < 0.0) return Span::none();

    const double s = std::sqrt(disc);
    Span out;
    out.t0 = -half_b - s;
    out.t1 = -half_b + s;
    out.n0 = Dir3(r.at(out.t0) - c).normalized();
    out.n1 = Dir3(r.at(out.t1) - c).normalized();
    return out;
}

Span tube_span(const Ray& r, int axis, const Point3& c, double radius) {
    const int u = (axis + 1) % 3;
    const int v = (axis + 2) % 3;
    const double ou = comp(r.o, u) - comp(c, u);
    const double ov = comp(r.o, v) - comp(c, v);
    const double du = comp(r.d, u);
    const double dv = comp(r.d, v);

    const double a = du * du + dv * dv;
    const double cterm = ou * ou + ov * ov - radius * radius;
    if (a == 0.0) {
        if (cterm > 0.0) return Span::none();
        return Span();
    }
    const double half_b = ou * du + ov * dv;
    const double disc = half_b * half_b - a * cterm;
    if (disc < 0.0) return Span::none();

    const double s = std::sqrt(disc);
    Span out;
    out.t0 = (-half_b - s) / a;
    out.t1 = (-half_b + s) / a;

    auto radial = [&](double t) {
        const Point3 p = r.at(t);
        const double pu = comp(p, u) - comp(c, u);
        const double pv = comp(p, v) - comp(c, v);
        return Dir3(axis_dir(u, pu) + axis_dir(v, pv)).normalized();
    };
    out.n0 = radial(out.t0);
    out.n1 = radial(out.t1);
    return out;
}

HitList span_hits(const Ray& r, const Span& s, const Primitive* prim) {
    HitList hits;
    if (s.empty || !(s.t0 < s.t1)) return hits;
    if (std::isfinite(s.t0) && in_ray_range(r, s.t0)) {
        hits.push_back(make_intersection(r, s.t0, s.n0, prim));
    }
    if (std::isfinite(s.t1) && in_ray_range(r, s.t1)) {
        hits.push_back(make_intersection(r, s.t1, s.n1, prim));
    }
    return hits;
}
