#pragma once
#include "geometry.h"

/**
 * @brief Inside-interval of a convex solid along a ray.
 * Entry/exit carry the outward normal of the boundary that produced them;
 * unbounded ends are ±kINF.
 */
struct Span {
    double t0{-kINF};
    double t1{kINF};
    Dir3 n0;
    Dir3 n1;
    bool empty{false};

    static Span none() { Span s; s.empty = true; return s; }
};

/// Overlap of two spans keeping the normals of the limiting boundaries.
Span span_intersect(const Span& a, const Span& b);

/**
 * @brief Span of the slab lo <= p[axis] <= hi.
 * @param r Local ray.
 * @param axis 0, 1 or 2.
 * @param lo Lower bound (may be -kINF).
 * @param hi Upper bound (may be kINF).
 */
Span slab_span(const Ray& r, int axis, double lo, double hi);

/// Span of the ball |p - c| <= radius.
Span ball_span(const Ray& r, const Point3& c, double radius);

/**
 * @brief Span of an infinite round cylinder.
 * @param r Local ray.
 * @param axis Cylinder axis (0, 1 or 2).
 * @param c Any point on the axis.
 * @param radius Cylinder radius.
 */
Span tube_span(const Ray& r, int axis, const Point3& c, double radius);

/**
 * @brief Convert a span into hits within [0, max_distance].
 * Tangent spans (t0 == t1) produce no hit.
 */
HitList span_hits(const Ray& r, const Span& s, const Primitive* prim);

/// Unit vector along @p axis with sign @p sign.
Dir3 axis_dir(int axis, double sign);
