#pragma once
#include "geometry.h"
#include "roots.h"

/**
 * @brief TorusSegment: toric cap solid with its base on z=0 and apex at z=height.
 *
 * The torus revolves about an axis parallel to y through (0, 0, height - major - minor).
 * Curvature in the yz-plane is @c minor, curvature in the xz-plane is @c major + @c minor.
 * Each quartic root is classified by where it falls: at or above z=0 it is a hit on the
 * curved face with a normal from the implicit gradient, below z=0 it is replaced by the
 * crossing of the flat base. When major < minor the quartic also vanishes on the inner
 * sheet of the self-intersecting tube; those roots lie inside the solid and are skipped.
 */
class TorusSegment final : public Primitive {
public:
    /**
     * @brief Construct a toric cap.
     * @param major Distance from the revolution axis to the tube centre (>0).
     * @param minor Tube radius (>0).
     * @param height Cap height, 0 < height <= minor.
     * @param name Optional label.
     * @param root_tolerance Relative imaginary-part tolerance used to accept quartic roots.
     * @throws GeometryError on invalid dimensions.
     */
    TorusSegment(double major, double minor, double height, std::string name = {},
                 double root_tolerance = kRootImagTolerance);

    double major_radius() const { return major_; }
    double minor_radius() const { return minor_; }
    double height() const { return height_; }
    double root_tolerance() const { return root_tolerance_; }
    std::string kind() const override { return "TorusSegment"; }

    /// Half-extent of the base along x.
    double base_half_width() const;
    /// Half-extent of the base along y.
    double base_half_depth() const;

    /**
     * @brief Implicit torus function; zero on both sheets of the surface.
     * Negative inside the tube only while major >= minor.
     * @param p Point in segment coordinates.
     */
    double implicit(const Point3& p) const;

    /// True if @p p lies in the swept tube, ignoring the base plane.
    bool in_tube(const Point3& p) const;

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    /// Outward normal of the torus surface at @p p.
    Dir3 gradient_normal(const Point3& p) const;
    /// True if a surface point belongs to the outer sheet (distance from the tube circle = minor).
    bool on_outer_sheet(const Point3& p) const;

    double major_;
    double minor_;
    double height_;
    double root_tolerance_;
    /// z of the revolution axis.
    double axis_z_;
};
