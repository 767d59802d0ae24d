#pragma once
#include <memory>
#include <string>

#include "geometry.h"
#include "lens_geometry.h"
#include "roots.h"

/// Surface family of a curved face.
enum class FaceFamily { Spherical, Cylindrical, Toric };

/// Printable name of a face family.
const char* to_string(FaceFamily family);

/**
 * @brief User-facing description of one lens or mirror face.
 * Curvatures are unsigned; the shape says which way the face bends.
 */
struct FaceSpec {
    FaceShape shape{FaceShape::Flat};
    FaceFamily family{FaceFamily::Spherical};
    /// Spherical or cylindrical radius; vertical (yz-plane) radius for toric faces.
    double curvature{0.0};
    /// Horizontal (xz-plane) radius, toric faces only.
    double curvature_horizontal{0.0};
    /// Cylindrical faces: curvature lies in the xz-plane instead of the yz-plane.
    bool horizontal{false};
    /// Relative tolerance for quartic roots of toric faces.
    double root_tolerance{kRootImagTolerance};

    static FaceSpec flat();
    static FaceSpec spherical(FaceShape shape, double curvature);
    static FaceSpec cylindrical(FaceShape shape, double curvature, bool horizontal = false);
    static FaceSpec toric(FaceShape shape, double vertical, double horizontal);
};

/// Derived geometry of one face over a given half-aperture.
struct FaceGeometry {
    FaceShape shape{FaceShape::Flat};
    FaceFamily family{FaceFamily::Spherical};
    /// Radius of the curved cap (torus minor radius for toric faces).
    double curvature{0.0};
    /// Torus major radius (toric faces only).
    double major{0.0};
    /// Rotation of the cap about the optical axis, 0 or 90 degrees.
    double rotation_deg{0.0};
    /// Axial depth of the cap at the rim.
    double sag{0.0};
    /// Relative tolerance for quartic roots of toric faces.
    double root_tolerance{kRootImagTolerance};
    /**
     * Axial extent, along the rim, of the solid that carries the face.
     * A convex face can bound the whole element on its own only if the element is shorter.
     */
    double chord_depth{kINF};
};

/**
 * @brief Validate a face and compute its sag, torus radii and orientation.
 * @param spec Face description.
 * @param half_aperture Radius of the rim the face must cover.
 * @throws GeometryError on impossible curvature/aperture pairs.
 */
FaceGeometry derive_face(const FaceSpec& spec, double half_aperture);

/// Turn of the face about the optical axis (0 or 90 degrees), known before any sizing.
double face_rotation(const FaceSpec& spec);

/**
 * @brief Depth below the vertex of a cap of curvature @p radius over the point (x, y).
 *
 * (x, y) are taken in the element frame; the face rotation and, for toric faces, the
 * major radius of @p face are applied. Depth grows with |x| and |y|.
 * @return NaN where the cap does not reach the point.
 */
double cap_depth(const FaceGeometry& face, double radius, double x, double y);

/**
 * @brief Solid whose boundary carries a face, placed with the face vertex at @p vertex_z.
 *
 * Convex faces get a solid on the element side of the vertex (intersect it with the body);
 * concave faces get the cavity on the outer side (subtract it from the body).
 * @param face Derived face geometry (not flat).
 * @param outward +1 if the face looks toward +z, -1 toward -z.
 * @param vertex_z Axial position of the vertex.
 * @param cover_half_width Half-extent the solid must span across the optical axis.
 */
std::shared_ptr<Primitive> make_face_solid(const FaceGeometry& face, double outward,
                                           double vertex_z, double cover_half_width);

/**
 * @brief Cap solid of curvature @p radius with apex at the local origin pointing +z.
 * Spherical faces give a SphereSegment, cylindrical a CylinderSegment, toric a TorusSegment;
 * each is a half-solid (height = radius) so concentric caps share the same centre.
 * @param face Face geometry providing family, orientation and torus major radius.
 * @param radius Cap radius (the face curvature, or less for an inner shell wall).
 * @param cover_half_width Half-extent to cover along a cylinder axis.
 */
std::shared_ptr<Primitive> make_cap_at_origin(const FaceGeometry& face, double radius,
                                              double cover_half_width);
