/**
 * @brief Curved cap solids: sphere, cylinder and torus segments.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "segments.h"
#include "torus.h"

/// Sphere segment of radius 2 and height 1: centre at z=-1, base disk on z=0.
TEST_CASE("SphereSegment", "[segments][sphere]") {
    SphereSegment cap(2.0, 1.0);

    REQUIRE(cap.base_radius() == Catch::Approx(std::sqrt(3.0)));

    /// Down the axis the ray meets the apex, then the base.
    SECTION("Axial ray") {
        const HitList hits = cap.hit_all(Ray(Point3(0, 0, 5), Dir3(0, 0, -1)));
        REQUIRE(hits.size() == 2);
        REQUIRE(hits[0].t == Catch::Approx(4.0));
        REQUIRE(hits[0].normal.z == Catch::Approx(1.0));
        REQUIRE(hits[1].t == Catch::Approx(5.0));
        REQUIRE(hits[1].normal.z == Catch::Approx(-1.0));
        REQUIRE(hits[1].exiting);
    }

    /// Across the cap both hits are on the curved face.
    SECTION("Transverse ray") {
        const HitList hits = cap.hit_all(Ray(Point3(-3, 0, 0.5), Dir3(1, 0, 0)));
        REQUIRE(hits.size() == 2);
        const double x = std::sqrt(4.0 - 1.5 * 1.5);
        REQUIRE(hits[0].t == Catch::Approx(3.0 - x));
        REQUIRE(hits[1].t == Catch::Approx(3.0 + x));
    }

    /// Below the base there is nothing.
    SECTION("Below the base") {
        REQUIRE(cap.hit_all(Ray(Point3(-3, 0, -0.5), Dir3(1, 0, 0))).empty());
        REQUIRE_FALSE(cap.contains(Point3(0, 0, -0.1)));
        REQUIRE(cap.contains(Point3(0, 0, 0.9)));
    }

    /// Bounds hug the base disk and the apex.
    SECTION("Bounds") {
        const BoundingBox box = cap.bounding_box();
        REQUIRE(box.upper.z == Catch::Approx(1.0));
        REQUIRE(box.upper.x == Catch::Approx(std::sqrt(3.0)));
    }

    /// Height must lie in (0, radius].
    SECTION("Validation") {
        REQUIRE_THROWS_AS(SphereSegment(1.0, 1.5), GeometryError);
        REQUIRE_THROWS_AS(SphereSegment(1.0, 0.0), GeometryError);
        REQUIRE_THROWS_AS(SphereSegment(-1.0, 0.5), GeometryError);
        REQUIRE_NOTHROW(SphereSegment(1.0, 1.0));
    }
}

/// Cylinder segment with its axis along x.
TEST_CASE("CylinderSegment", "[segments][cylinder]") {
    CylinderSegment cap(2.0, 1.0, 3.0);

    /// Along the axis the ray crosses the two end planes.
    SECTION("Ray along the axis") {
        const HitList hits = cap.hit_all(Ray(Point3(-5, 0, 0.5), Dir3(1, 0, 0)));
        REQUIRE(hits.size() == 2);
        REQUIRE(hits[0].t == Catch::Approx(3.5));
        REQUIRE(hits[0].normal.x == Catch::Approx(-1.0));
        REQUIRE(hits[1].t == Catch::Approx(6.5));
    }

    /// From above the ray meets the curved face, off the apex line.
    SECTION("Ray from above") {
        const HitList hits = cap.hit_all(Ray(Point3(1, 0.5, 5), Dir3(0, 0, -1)));
        REQUIRE(hits.size() == 2);
        const double z = -1.0 + std::sqrt(4.0 - 0.25);
        REQUIRE(hits[0].t == Catch::Approx(5.0 - z));
        REQUIRE(hits[0].normal.x == Catch::Approx(0.0).margin(1e-12));
        REQUIRE(hits[0].normal.y > 0.0);
        REQUIRE(hits[1].t == Catch::Approx(5.0));
    }

    /// Outside the length the ray misses.
    SECTION("Beyond the ends") {
        REQUIRE(cap.hit_all(Ray(Point3(1.6, 0, 5), Dir3(0, 0, -1))).empty());
        REQUIRE_FALSE(cap.contains(Point3(1.6, 0, 0.5)));
    }

    REQUIRE(cap.base_half_width() == Catch::Approx(std::sqrt(3.0)));
    REQUIRE_THROWS_AS(CylinderSegment(2.0, 1.0, 0.0), GeometryError);
}

/// Ring torus segment: major 2, minor 1, height 0.5; revolution axis parallel to y at z=-2.5.
TEST_CASE("TorusSegment ring", "[segments][torus]") {
    TorusSegment cap(2.0, 1.0, 0.5);
    const double axis_z = -2.5;

    REQUIRE(cap.base_half_width() == Catch::Approx(std::sqrt(9.0 - 2.5 * 2.5)));
    REQUIRE(cap.base_half_depth() == Catch::Approx(std::sqrt(0.75)));

    /// A ray parallel to the revolution axis crosses the tube twice.
    SECTION("Ray along the revolution axis") {
        const HitList hits = cap.hit_all(Ray(Point3(0.1, -5, 0.3), Dir3(0, 1, 0)));
        REQUIRE(hits.size() == 2);
        const double rho = std::sqrt(0.01 + (0.3 - axis_z) * (0.3 - axis_z)) - 2.0;
        const double y = std::sqrt(1.0 - rho * rho);
        REQUIRE(hits[0].t == Catch::Approx(5.0 - y));
        REQUIRE(hits[1].t == Catch::Approx(5.0 + y));
        REQUIRE(hits[0].normal.y < 0.0);
        REQUIRE(hits[1].exiting);
    }

    /// Straight down the ray meets the curved face, then the base plane.
    SECTION("Ray toward the base") {
        const HitList hits = cap.hit_all(Ray(Point3(0.1, 0.2, 5), Dir3(0, 0, -1)));
        REQUIRE(hits.size() == 2);
        const double rho = 2.0 + std::sqrt(1.0 - 0.04);
        const double z = axis_z + std::sqrt(rho * rho - 0.01);
        REQUIRE(hits[0].t == Catch::Approx(5.0 - z));
        REQUIRE(hits[0].normal.z > 0.9);
        REQUIRE(hits[1].t == Catch::Approx(5.0));
        REQUIRE(hits[1].normal.z == Catch::Approx(-1.0));
    }

    /// A ray above the apex misses.
    SECTION("Miss") {
        REQUIRE(cap.hit_all(Ray(Point3(-5, 0, 0.6), Dir3(1, 0, 0))).empty());
    }

    /// Containment follows the tube and the base plane.
    SECTION("Containment") {
        REQUIRE(cap.contains(Point3(0, 0, 0.25)));
        REQUIRE_FALSE(cap.contains(Point3(0, 0, -0.25)));
        REQUIRE_FALSE(cap.contains(Point3(0, 0.9, 0.25)));
    }

    /// Height must not exceed the minor radius.
    SECTION("Validation") {
        REQUIRE_THROWS_AS(TorusSegment(2.0, 1.0, 1.5), GeometryError);
        REQUIRE_THROWS_AS(TorusSegment(0.0, 1.0, 0.5), GeometryError);
        REQUIRE_THROWS_AS(TorusSegment(2.0, 1.0, 0.5, "", 0.0), GeometryError);
    }
}

/// Spindle torus segment (major < minor): the self-intersecting core is still solid.
TEST_CASE("TorusSegment spindle", "[segments][torus]") {
    TorusSegment cap(2.0, 10.0, 10.0);

    /// Down the middle only the outer sheet and the base count.
    SECTION("Axial ray") {
        const HitList hits = cap.hit_all(Ray(Point3(0, 0, 20), Dir3(0, 0, -1)));
        REQUIRE(hits.size() == 2);
        REQUIRE(hits[0].t == Catch::Approx(10.0));
        REQUIRE(hits[1].t == Catch::Approx(20.0));
    }

    /// Points between the two sheets of the quartic are inside.
    SECTION("Core containment") {
        REQUIRE(cap.contains(Point3(0, 0, 0.1)));
        REQUIRE(cap.contains(Point3(0, 0, 6.0)));
        REQUIRE_FALSE(cap.contains(Point3(0, 0, 10.5)));
    }
}

/// With a vanishing major radius the torus segment matches a sphere segment of the minor radius.
TEST_CASE("TorusSegment degenerates to a sphere segment", "[segments][torus]") {
    const double minor = 1.0;
    const double height = 0.5;
    TorusSegment torus(1e-6, minor, height);
    SphereSegment sphere(minor, height);

    const Ray rays[] = {
        Ray(Point3(0.1, -3, 0.2), Dir3(0, 1, 0)),
        Ray(Point3(-0.2, 3, 0.1), Dir3(0, -1, 0)),
        Ray(Point3(0.1, 0.2, 3), Dir3(0, 0, -1)),
    };

    for (const Ray& ray : rays) {
        const HitList expected = sphere.hit_all(ray);
        const HitList actual = torus.hit_all(ray);
        REQUIRE(expected.size() == 2);
        REQUIRE(actual.size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            REQUIRE(actual[i].t == Catch::Approx(expected[i].t).margin(1e-4));
            REQUIRE(actual[i].normal.x == Catch::Approx(expected[i].normal.x).margin(1e-3));
            REQUIRE(actual[i].normal.y == Catch::Approx(expected[i].normal.y).margin(1e-3));
            REQUIRE(actual[i].normal.z == Catch::Approx(expected[i].normal.z).margin(1e-3));
            REQUIRE(actual[i].exiting == expected[i].exiting);
        }
    }
}
