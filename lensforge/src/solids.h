#pragma once
#include "geometry.h"

/// Sphere: ball of the given radius centred on the local origin.
class Sphere final : public Primitive {
public:
    /**
     * @brief Construct a ball.
     * @param radius Radius (>0).
     * @param name Optional label.
     * @throws GeometryError if radius <= 0.
     */
    explicit Sphere(double radius, std::string name = {});

    double radius() const { return radius_; }
    std::string kind() const override { return "Sphere"; }

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    double radius_;
};

/// Cylinder: solid round bar along +z with 0 <= z <= length.
class Cylinder final : public Primitive {
public:
    /**
     * @brief Construct a capped cylinder.
     * @param radius Radius (>0).
     * @param length Axial length (>0).
     * @param name Optional label.
     */
    Cylinder(double radius, double length, std::string name = {});

    double radius() const { return radius_; }
    double length() const { return length_; }
    std::string kind() const override { return "Cylinder"; }

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    double radius_;
    double length_;
};

/// Box: axis-aligned solid between two corners.
class Box final : public Primitive {
public:
    /**
     * @brief Construct a box.
     * @param lower Minimum corner.
     * @param upper Maximum corner (strictly greater on every axis).
     * @param name Optional label.
     */
    Box(const Point3& lower, const Point3& upper, std::string name = {});

    const Point3& lower() const { return lower_; }
    const Point3& upper() const { return upper_; }
    std::string kind() const override { return "Box"; }

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    Point3 lower_;
    Point3 upper_;
};
