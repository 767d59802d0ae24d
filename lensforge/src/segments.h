#pragma once
#include "geometry.h"

/**
 * @brief SphereSegment: spherical cap solid with its base disk on z=0 and apex at z=height.
 * The sphere centre sits at (0, 0, height - radius), so the curved face bulges toward +z.
 */
class SphereSegment final : public Primitive {
public:
    /**
     * @brief Construct a spherical cap.
     * @param radius Curvature radius (>0).
     * @param height Cap height, 0 < height <= radius.
     * @param name Optional label.
     * @throws GeometryError on invalid dimensions.
     */
    SphereSegment(double radius, double height, std::string name = {});

    double radius() const { return radius_; }
    double height() const { return height_; }
    /// Radius of the base disk.
    double base_radius() const;
    std::string kind() const override { return "SphereSegment"; }

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    double radius_;
    double height_;
};

/**
 * @brief CylinderSegment: cylindrical cap solid, axis along x, base on z=0, apex line at z=height.
 * Curvature lies in the yz-plane; the cap is clipped to |x| <= length/2.
 */
class CylinderSegment final : public Primitive {
public:
    /**
     * @brief Construct a cylindrical cap.
     * @param radius Curvature radius (>0).
     * @param height Cap height, 0 < height <= radius.
     * @param length Extent along the cylinder axis (>0).
     * @param name Optional label.
     */
    CylinderSegment(double radius, double height, double length, std::string name = {});

    double radius() const { return radius_; }
    double height() const { return height_; }
    double length() const { return length_; }
    /// Half-width of the base rectangle across the axis.
    double base_half_width() const;
    std::string kind() const override { return "CylinderSegment"; }

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    double radius_;
    double height_;
    double length_;
};
