#pragma once

/**
 * @brief Pure calculators shared by the lens and mirror builders.
 * Every function validates its inputs and throws GeometryError before returning.
 */

/// Padding between coincident CSG boundaries, as a fraction of the axial thickness.
constexpr double kPaddingFraction = 1e-6;
/// Dimensions below this are treated as zero.
constexpr double kSmallNumber = 1e-8;

/// Axial padding for an element of the given thickness.
inline double padding_for(double thickness) { return kPaddingFraction * thickness; }

/// Orientation of a lens face as seen from outside the lens.
enum class FaceShape { Flat, Convex, Concave };

/// Printable name of a face shape.
const char* to_string(FaceShape shape);

/**
 * @brief Sag of a spherical or cylindrical cap.
 * @param curvature Curvature radius (>0).
 * @param half_aperture Half-diameter, or half-width across a cylinder axis.
 * @return curvature - sqrt(curvature² - half_aperture²).
 * @throws GeometryError if curvature < half_aperture or either is non-positive.
 */
double cap_sag(double curvature, double half_aperture);

/// Torus decomposition of a face with distinct vertical and horizontal curvatures.
struct ToricFace {
    /// Smaller of the two curvatures.
    double minor{0.0};
    /// |vertical - horizontal|.
    double major{0.0};
    /// 0 when the vertical curvature is the minor one, 90 otherwise.
    double rotation_deg{0.0};
    /// Cap sag over the minor radius.
    double sag{0.0};
};

/**
 * @brief Split a toric face into torus radii and an axis rotation.
 * @param vertical Curvature in the yz-plane (>0).
 * @param horizontal Curvature in the xz-plane (>0).
 * @param half_aperture Half-diameter of the face.
 * @throws GeometryError if the curvatures are equal or too small for the aperture.
 */
ToricFace toric_face(double vertical, double horizontal, double half_aperture);

/**
 * @brief Axial length of the straight barrel between two faces.
 * Convex faces shorten the barrel by their sag, concave faces lengthen it.
 * @throws GeometryError if the result is negative.
 */
double edge_thickness(double center_thickness,
                      FaceShape front, double front_sag,
                      FaceShape back, double back_sag);

/// Radial reach of a mirror frame measured from the curvature axis.
struct FrameExtent {
    /// Closest point of the mirror body to the axis.
    double inner{0.0};
    /// Farthest point of the mirror body from the axis.
    double outer{0.0};
};

/**
 * @brief Extent of a round frame with a concentric round aperture.
 * @param diameter Frame diameter (>0).
 * @param aperture Aperture diameter, 0 <= aperture < diameter.
 * @param decenter_x Horizontal offset of the frame centre from the axis.
 * @param decenter_y Vertical offset of the frame centre from the axis.
 */
FrameExtent round_frame_extent(double diameter, double aperture,
                               double decenter_x, double decenter_y);

/**
 * @brief Extent of a rectangular frame with a centred round aperture.
 * @param width Frame width (>0).
 * @param height Frame height (>0).
 * @param aperture Aperture diameter, smaller than both sides.
 */
FrameExtent rect_frame_extent(double width, double height, double aperture,
                              double decenter_x, double decenter_y);

/// Reach of a mirror frame along the two axes of a face turned about the optical axis.
struct FrameReach {
    /// Farthest frame point across the curvature axis.
    double across{0.0};
    /// Farthest frame point along the curvature axis.
    double along{0.0};
};

/**
 * @brief Reach of the frame |x - decenter_x| <= half_x, |y - decenter_y| <= half_y.
 * @param rotation_deg Face rotation, 0 (curvature axis along x) or 90 (along y).
 */
FrameReach frame_reach(double half_x, double half_y,
                       double decenter_x, double decenter_y, double rotation_deg);

/**
 * @brief Require a curvature radius that reaches the farthest frame point.
 * @throws GeometryError if curvature < outer.
 */
void check_curvature_covers(double curvature, double outer);
