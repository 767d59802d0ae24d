/**
 * @brief Core math tests: homogeneous vectors, matrices, rays, placement helpers and bounds.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "bounds.h"
#include "core.h"
#include "transform.h"

/// Homogeneous tags: points carry w=1, directions w=0, and differences of points are directions.
TEST_CASE("Homogeneous vectors", "[core][vec4]") {
    const Point3 back(0, 0, 0);
    const Point3 front(0, 3, 4);

    /// Vertex-to-vertex offset is a direction of the expected length.
    SECTION("Point difference") {
        const Vec4 axis = front - back;
        REQUIRE(axis.w == 0);
        REQUIRE(axis.length() == Catch::Approx(5.0));
        REQUIRE(axis.dot(Dir3(0, 0, 1)) == Catch::Approx(4.0));
    }

    /// Cross product of two in-plane edges gives the plane normal.
    SECTION("Cross product") {
        const Vec4 n = Dir3(1, 0, 0).cross(Dir3(0, 1, 0));
        REQUIRE(n.z == Catch::Approx(1.0));
        REQUIRE(n.w == 0);
    }

    /// A degenerate direction normalizes to the optical axis.
    SECTION("Degenerate normalization") {
        const Dir3 d = Dir3(0, 0, 0).normalized();
        REQUIRE(d.z == 1.0);
        REQUIRE(Dir3().z == 1.0);
    }
}

/// Matrix generators act on column vectors; translation ignores directions.
TEST_CASE("Matrix composition", "[core][matrix]") {
    const Matrix4 shift = Matrix4::translation(0, 0, 10);
    const Matrix4 turn = Matrix4::rotation_y(kPI);

    /// The right-hand factor is applied first.
    SECTION("Order of application") {
        const Vec4 a = (shift * turn) * Point3(1, 0, 1);
        REQUIRE(a.x == Catch::Approx(-1.0));
        REQUIRE(a.z == Catch::Approx(9.0));
        const Vec4 b = (turn * shift) * Point3(1, 0, 1);
        REQUIRE(b.z == Catch::Approx(-11.0));
    }

    /// Directions are unaffected by translation.
    SECTION("Directions ignore translation") {
        const Vec4 d = shift * Dir3(0, 1, 0);
        REQUIRE(d.y == Catch::Approx(1.0));
        REQUIRE(d.z == Catch::Approx(0.0));
    }

    /// The affine inverse undoes a rigid placement.
    SECTION("Affine inverse") {
        const Matrix4 M = shift * turn;
        const Vec4 p = M.inverse() * (M * Point3(2, -1, 3));
        REQUIRE(p.x == Catch::Approx(2.0));
        REQUIRE(p.y == Catch::Approx(-1.0));
        REQUIRE(p.z == Catch::Approx(3.0));
    }
}

/// Rays keep a unit direction and a search limit.
TEST_CASE("Rays", "[core][ray]") {
    const Ray r(Point3(0, 0, -5), Dir3(0, 0, 2), 12.0);

    /// The direction is normalized on construction.
    SECTION("Unit direction") {
        REQUIRE(r.d.length() == Catch::Approx(1.0));
        REQUIRE(r.at(5.0).z == Catch::Approx(0.0));
    }

    /// The limit defaults to infinity.
    SECTION("Search limit") {
        REQUIRE(r.max_distance == 12.0);
        REQUIRE(std::isinf(Ray(Point3(), Dir3()).max_distance));
    }
}

/// Placement helpers used by the lens and mirror builders.
TEST_CASE("Affine placement helpers", "[core][xform]") {
    /// flip(t) maps (x,y,z) to (-x, y, t - z).
    SECTION("Flip swaps back and front") {
        const Point3 p = xform::apply_point(xform::flip(5.0), Point3(1, 2, 1));
        REQUIRE(p.x == Catch::Approx(-1.0));
        REQUIRE(p.y == Catch::Approx(2.0));
        REQUIRE(p.z == Catch::Approx(4.0));
    }

    /// Rotations are in degrees and follow the right-hand rule.
    SECTION("Rotation about z") {
        const Dir3 d = xform::apply_direction(xform::rotate_z(90.0), Dir3(1, 0, 0));
        REQUIRE(d.x == Catch::Approx(0.0).margin(1e-12));
        REQUIRE(d.y == Catch::Approx(1.0));
        REQUIRE(d.z == Catch::Approx(0.0).margin(1e-12));
    }

    /// Rotations and translations are rigid; scaling is not.
    SECTION("Rigid check") {
        REQUIRE(xform::is_rigid(xform::rotate_x(30.0) * xform::translate(1, 2, 3)));
        REQUIRE(xform::is_rigid(xform::flip(2.0)));
        REQUIRE_FALSE(xform::is_rigid(Matrix4::scaling(2, 1, 1)));
    }

    /// Normals follow the inverse-transpose and stay unit length.
    SECTION("Normal mapping") {
        const Matrix4 M = xform::rotate_y(90.0);
        const Dir3 n = xform::apply_normal(M.inverse(), Dir3(0, 0, 1));
        REQUIRE(n.x == Catch::Approx(1.0));
        REQUIRE(n.length() == Catch::Approx(1.0));
    }

    /// to_local keeps the search limit.
    SECTION("Ray to local frame") {
        const Ray r(Point3(0, 0, 0), Dir3(0, 0, 1), 7.5);
        const Ray local = xform::to_local(xform::translate(0, 0, -2), r);
        REQUIRE(local.o.z == Catch::Approx(-2.0));
        REQUIRE(local.max_distance == Catch::Approx(7.5));
    }
}

/// Axis-aligned boxes: empty state, union, overlap and transforms.
TEST_CASE("Bounding boxes", "[core][bounds]") {
    const BoundingBox a(Point3(0, 0, 0), Point3(1, 1, 1));
    const BoundingBox b(Point3(2, 2, 2), Point3(3, 3, 3));

    /// A default box is empty and has zero extent.
    SECTION("Empty box") {
        BoundingBox e;
        REQUIRE(e.empty());
        REQUIRE(e.extent(0) == 0.0);
        e.extend(Point3(1, 2, 3));
        REQUIRE_FALSE(e.empty());
    }

    /// Disjoint boxes unite to the hull and overlap to nothing.
    SECTION("Union and intersection") {
        const BoundingBox u = a.united(b);
        REQUIRE(u.extent(0) == Catch::Approx(3.0));
        REQUIRE(a.intersected(b).empty());
        REQUIRE(a.intersected(u).extent(2) == Catch::Approx(1.0));
    }

    /// Transforming a box encloses every corner.
    SECTION("Rotated box") {
        const BoundingBox r = a.transformed(xform::rotate_z(45.0));
        REQUIRE(r.extent(0) == Catch::Approx(std::sqrt(2.0)));
        REQUIRE(r.extent(2) == Catch::Approx(1.0));
    }

    /// The bounding sphere reaches every corner.
    SECTION("Bounding sphere") {
        const BoundingSphere s = BoundingSphere::around(a);
        REQUIRE(s.radius >= 0.5 * std::sqrt(3.0));
        REQUIRE(s.center.x == Catch::Approx(0.5));
    }
}
