#pragma once
#include "core.h"

/**
 * @brief Affine placement helpers shared by primitives and builders.
 * Angles are in degrees, matching optical prescriptions.
 */
namespace xform {

/// Translation by (x,y,z).
inline Matrix4 translate(double x, double y, double z) {
    return Matrix4::translation(x, y, z);
}

/// Rotation about +X by @p degrees.
inline Matrix4 rotate_x(double degrees) { return Matrix4::rotation_x(deg2rad(degrees)); }
/// Rotation about +Y by @p degrees.
inline Matrix4 rotate_y(double degrees) { return Matrix4::rotation_y(deg2rad(degrees)); }
/// Rotation about +Z by @p degrees.
inline Matrix4 rotate_z(double degrees) { return Matrix4::rotation_z(deg2rad(degrees)); }

/**
 * @brief Swap the back and front sides of an element of axial length @p thickness.
 * Equivalent to rotate_y(180) followed by a shift of @p thickness along +z.
 * @param thickness Axial thickness of the element.
 * @return Matrix mapping (x,y,z) to (-x, y, thickness - z).
 */
Matrix4 flip(double thickness);

/// Map a point through @p M.
Point3 apply_point(const Matrix4& M, const Point3& p);

/// Map a direction through @p M (translation ignored).
Dir3 apply_direction(const Matrix4& M, const Dir3& d);

/**
 * @brief Map a normal through @p M using the inverse-transpose.
 * @param M_inverse Inverse of the transform that maps points.
 * @param n Unit normal.
 * @return Unit normal in the target frame.
 */
Dir3 apply_normal(const Matrix4& M_inverse, const Dir3& n);

/**
 * @brief Express a ray in a child frame.
 * The search limit is carried over unchanged; transforms are rigid so distances are preserved.
 * @param to_local Parent-to-child transform.
 * @param r Ray in the parent frame.
 * @return Ray in the child frame.
 */
Ray to_local(const Matrix4& to_local, const Ray& r);

/// True if the upper 3×3 block is orthonormal within @p tol.
bool is_rigid(const Matrix4& M, double tol = 1e-9);

} // namespace xform
