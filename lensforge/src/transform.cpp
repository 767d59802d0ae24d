#include "transform.h"
#include <cmath>

namespace xform {

Matrix4 flip(double thickness) {
    Matrix4 m;
    m.m[0][0] = -1.0;
    m.m[2][2] = -1.0;
    m.m[2][3] = thickness;
    return m;
}

Point3 apply_point(const Matrix4& M, const Point3& p) {
    Vec4 p_4d = M * Vec4(p.x, p.y, p.z, 1.0);
    return Point3(p_4d.x, p_4d.y, p_4d.z);
}

Dir3 apply_direction(const Matrix4& M, const Dir3& d) {
    Vec4 d_4d = M * Vec4(d.x, d.y, d.z, 0.0);
    return Dir3(d_4d.x, d_4d.y, d_4d.z);
}

Dir3 apply_normal(const Matrix4& M_inverse, const Dir3& n) {
    // transpose of the inverse's 3x3 block
    const auto& a = M_inverse.m;
    return Dir3(
        a[0][0]*n.x + a[1][0]*n.y + a[2][0]*n.z,
        a[0][1]*n.x + a[1][1]*n.y + a[2][1]*n.z,
        a[0][2]*n.x + a[1][2]*n.y + a[2][2]*n.z
    ).normalized();
}

Ray to_local(const Matrix4& to_local, const Ray& r) {
    return Ray(apply_point(to_local, r.o), apply_direction(to_local, r.d), r.max_distance);
}

bool is_rigid(const Matrix4& M, double tol) {
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            double dot = 0.0;
            for (int k = 0; k < 3; ++k) dot += M.m[k][i] * M.m[k][j];
            const double expected = (i == j) ? 1.0 : 0.0;
            if (std::abs(dot - expected) > tol) return false;
        }
    }
    return true;
}

} // namespace xform
