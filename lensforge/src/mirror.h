#pragma once
#include <memory>
#include <string>

#include "faces.h"
#include "geometry.h"

/// Thickness given to mirrors whose prescription carries none.
constexpr double kDefaultMirrorThickness = 1e-6;

/// Outline of a mirror frame.
enum class FrameShape { Round, Rectangular };

/**
 * @brief Outline, central hole and decenter of a mirror.
 * The hole is round and centred on the frame; decenter moves both off the curvature axis.
 */
struct MirrorFrame {
    FrameShape shape{FrameShape::Round};
    /// Round frames: outer diameter.
    double diameter{0.0};
    /// Rectangular frames: extent along x.
    double width{0.0};
    /// Rectangular frames: extent along y.
    double height{0.0};
    /// Diameter of the central hole (0 = none).
    double aperture{0.0};
    double decenter_x{0.0};
    double decenter_y{0.0};

    static MirrorFrame round(double diameter, double aperture = 0.0,
                             double decenter_x = 0.0, double decenter_y = 0.0);
    static MirrorFrame rectangular(double width, double height, double aperture = 0.0,
                                   double decenter_x = 0.0, double decenter_y = 0.0);
};

/**
 * @brief Mirror: thin curved shell cut by a frame prism, optionally pierced by a hole.
 *
 * Local frame: the vertex of the reflecting face is at the origin, the face bulges toward +z
 * and the shell extends toward -z. The shell is the region between the face and a concentric
 * surface @c thickness below it, so the same solid serves rays arriving from either side.
 */
class Mirror : public Primitive {
public:
    const FaceGeometry& face() const { return face_; }
    const MirrorFrame& frame() const { return frame_; }
    /// Radial reach of the frame from the curvature axis.
    const FrameExtent& extent() const { return extent_; }
    /// Reach of the frame across and along the curvature axis of the face.
    const FrameReach& reach() const { return reach_; }
    double thickness() const { return thickness_; }
    /// Sag of the reflecting face at its deepest frame point.
    double sag() const { return sag_; }
    /// Axial depth of the shell, from the vertex to the back surface at its deepest frame point.
    double depth() const { return depth_; }
    double padding() const { return padding_; }

    /// Root of the internal CSG tree (mirror frame).
    const Primitive& solid() const { return *solid_; }

    std::string kind() const override { return kind_; }

    /// One-line summary of the derived geometry.
    std::string describe() const;

protected:
    /**
     * @brief Validate and assemble a mirror.
     * @param kind Type label reported by kind().
     * @param face Curved face; its shape is ignored.
     * @param frame Frame outline and hole.
     * @param thickness Shell thickness, 0 < thickness < curvature.
     * @param name Optional label.
     * Spherical faces are sized by the radial extent of the frame. Cylindrical and toric
     * faces are sized across their curvature axis only; a toric face must also reach the
     * frame along the axis with its major + minor radius.
     * @throws GeometryError if the curvature cannot reach the frame edge.
     */
    Mirror(std::string kind, FaceSpec face, const MirrorFrame& frame,
           double thickness, std::string name);

    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    std::shared_ptr<Primitive> build() const;
    /// Largest cap_depth() of a cap of the given curvature over the frame outline.
    double deepest(double radius) const;

    std::string kind_;
    FaceGeometry face_;
    MirrorFrame frame_;
    FrameExtent extent_;
    FrameReach reach_;
    double thickness_;
    double sag_{0.0};
    double depth_{0.0};
    double padding_{0.0};
    std::shared_ptr<Primitive> solid_;
};

/// Spherical mirror; kind() reports the frame outline.
class SphericalMirror final : public Mirror {
public:
    SphericalMirror(double curvature, const MirrorFrame& frame,
                    double thickness = kDefaultMirrorThickness, std::string name = {});
};

/// Cylindrical mirror; curvature in the yz-plane, or the xz-plane when @p horizontal.
class CylindricalMirror final : public Mirror {
public:
    CylindricalMirror(double curvature, const MirrorFrame& frame, bool horizontal = false,
                      double thickness = kDefaultMirrorThickness, std::string name = {});
};

/// Toric mirror with distinct vertical (yz) and horizontal (xz) curvatures.
class ToricMirror final : public Mirror {
public:
    ToricMirror(double vertical, double horizontal, const MirrorFrame& frame,
                double thickness = kDefaultMirrorThickness, std::string name = {},
                double root_tolerance = kRootImagTolerance);
};
