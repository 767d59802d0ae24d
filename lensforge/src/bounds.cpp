#include "bounds.h"

void BoundingBox::extend(const Point3& p) {
    lower = Point3(std::min(lower.x, p.x), std::min(lower.y, p.y), std::min(lower.z, p.z));
    upper = Point3(std::max(upper.x, p.x), std::max(upper.y, p.y), std::max(upper.z, p.z));
}

BoundingBox BoundingBox::padded(double amount) const {
    if (empty()) return *this;
    return BoundingBox(Point3(lower.x - amount, lower.y - amount, lower.z - amount),
                       Point3(upper.x + amount, upper.y + amount, upper.z + amount));
}

BoundingBox BoundingBox::united(const BoundingBox& other) const {
    if (empty()) return other;
    if (other.empty()) return *this;
    BoundingBox out = *this;
    out.extend(other.lower);
    out.extend(other.upper);
    return out;
}

BoundingBox BoundingBox::intersected(const BoundingBox& other) const {
    if (empty() || other.empty()) return BoundingBox();
    BoundingBox out(Point3(std::max(lower.x, other.lower.x),
                           std::max(lower.y, other.lower.y),
                           std::max(lower.z, other.lower.z)),
                    Point3(std::min(upper.x, other.upper.x),
                           std::min(upper.y, other.upper.y),
                           std::min(upper.z, other.upper.z)));
    if (out.empty()) return BoundingBox();
    return out;
}

BoundingBox BoundingBox::transformed(const Matrix4& M) const {
    if (empty()) return *this;
    BoundingBox out;
    for (int i = 0; i < 8; ++i) {
        const Point3 corner((i & 1) ? upper.x : lower.x,
                            (i & 2) ? upper.y : lower.y,
                            (i & 4) ? upper.z : lower.z);
        out.extend(Point3(M * corner));
    }
    return out;
}

double BoundingBox::extent(int axis) const {
    if (empty()) return 0.0;
    switch (axis) {
        case 0: return upper.x - lower.x;
        case 1: return upper.y - lower.y;
        default: return upper.z - lower.z;
    }
}

BoundingSphere BoundingSphere::around(const BoundingBox& box) {
    BoundingSphere s;
    if (box.empty()) return s;
    s.center = box.center();
    s.radius = 0.5 * (box.upper - box.lower).length() * kSpherePadding;
    return s;
}
