#pragma once
#include <memory>
#include <stdexcept>

#include "geometry.h"
#include "roots.h"
#include "surface.h"

/// Raised when a prescription cannot be turned into a primitive.
class CannotCreatePrimitive : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Semi-diameters and non-zero thicknesses below this are rejected.
constexpr double kMinimumDimension = 1e-8;
/// Thickness of a flat slab whose prescription gives none.
constexpr double kDefaultThickness = 1e-6;

/// -1, 0 or +1.
int sign_of(double x);

/**
 * @brief Build the element between two consecutive prescription surfaces.
 *
 * Radius signs are multiplied by @p direction before choosing the variant:
 * bi-convex (back > 0, front < 0), bi-concave (back < 0, front > 0), meniscus (both < 0),
 * reversed meniscus (both > 0), plano-convex / plano-concave with one flat side, or a plain
 * Cylinder (Box for a rectangular aperture) when both sides are flat. Reversed variants are
 * built with swapped faces and placed with xform::flip(center_thickness).
 * The lens frame puts the back vertex at z=0 and the front vertex at z=|back.thickness|.
 *
 * @param back Entry surface; its thickness is the lens center thickness.
 * @param front Exit surface.
 * @param direction Propagation direction, +1 or -1.
 * @param root_tolerance Quartic root tolerance for toric faces.
 * @throws CannotCreatePrimitive if the surfaces do not describe a buildable lens.
 */
std::shared_ptr<Primitive> create_lens(const SurfaceDesc& back, const SurfaceDesc& front,
                                       int direction = 1,
                                       double root_tolerance = kRootImagTolerance);

/**
 * @brief Build a mirror from one prescription surface.
 * Flat surfaces give a Circle or Rectangle; curved ones a spherical, cylindrical or toric
 * Mirror of thickness kDefaultMirrorThickness, oriented by mirror_direction_transform().
 * @throws CannotCreatePrimitive if the surface does not describe a buildable mirror.
 */
std::shared_ptr<Primitive> create_mirror(const SurfaceDesc& surface, int direction = 1,
                                         double root_tolerance = kRootImagTolerance);

/**
 * @brief Placement of a curved mirror for a propagation direction.
 * Mirrors are built with the reflecting face bulging toward +z; they are turned about y
 * when @p direction * @p curvature_sign is positive, otherwise left in place.
 */
Matrix4 mirror_direction_transform(int direction, int curvature_sign);
