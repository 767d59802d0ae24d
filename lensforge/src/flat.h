#pragma once
#include "geometry.h"

/**
 * @brief Circle: zero-thickness disk of given radius in the plane z=0.
 * The geometric normal is +z; a ray travelling along +z is exiting.
 */
class Circle final : public Primitive {
public:
    explicit Circle(double radius, std::string name = {});

    double radius() const { return radius_; }
    std::string kind() const override { return "Circle"; }

protected:
    HitList local_hits(const Ray& r) const override;
    /// Exact: the point must lie in z=0 within the radius.
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    double radius_;
};

/// Rectangle: zero-thickness |x|<=width/2, |y|<=height/2 in the plane z=0.
class Rectangle final : public Primitive {
public:
    Rectangle(double width, double height, std::string name = {});

    double width() const { return width_; }
    double height() const { return height_; }
    std::string kind() const override { return "Rectangle"; }

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    double width_;
    double height_;
};

/**
 * @brief Triangle: zero-thickness facet through three vertices.
 * Normal follows the right-hand rule over (v1, v2, v3).
 */
class Triangle final : public Primitive {
public:
    /**
     * @brief Construct from three local-space vertices.
     * @throws GeometryError if the vertices are collinear.
     */
    Triangle(const Point3& v1, const Point3& v2, const Point3& v3, std::string name = {});

    const Point3& v1() const { return v1_; }
    const Point3& v2() const { return v2_; }
    const Point3& v3() const { return v3_; }
    const Dir3& normal() const { return normal_; }
    std::string kind() const override { return "Triangle"; }

    /**
     * @brief Barycentric weights of a point in the triangle's plane.
     * Each weight is a sub-triangle's twice-signed-area over the full twice-area.
     * @param p Point in the plane.
     * @param a Weight of v1.
     * @param b Weight of v2.
     * @param c Weight of v3.
     */
    void barycentric(const Point3& p, double& a, double& b, double& c) const;

protected:
    HitList local_hits(const Ray& r) const override;
    bool local_contains(const Point3& p) const override;
    BoundingBox local_bounds() const override;

private:
    Point3 v1_, v2_, v3_;
    /// Unit normal.
    Dir3 normal_;
    /// Twice the triangle area.
    double twice_area_;
};
