/**
 * @brief Lens builders: axial hits, short/long assembly, bounds and construction failures.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "lens.h"
#include "transform.h"

namespace {

/// Distances of every hit of a ray fired from z=-20 along +z at (x, y).
std::vector<double> axial_hits(const Primitive& p, double x = 0.0, double y = 0.0) {
    std::vector<double> z;
    for (const auto& h : p.hit_all(Ray(Point3(x, y, -20.0), Dir3(0, 0, 1)))) {
        z.push_back(h.t - 20.0);
    }
    return z;
}

} // anon

/// Ray along the optical axis meets the back vertex, then the front vertex.
TEST_CASE("Axial ray through a bi-convex lens", "[lens][spherical]") {
    BiConvex lens(12.0, 5.0, 10.0, 10.0);

    const std::vector<double> z = axial_hits(lens);
    REQUIRE(z.size() == 2);
    REQUIRE(z[0] == Catch::Approx(0.0).margin(1e-9));
    REQUIRE(z[1] == Catch::Approx(5.0));

    /// Entry normal faces the incoming ray, exit normal points along it.
    SECTION("Normals") {
        const HitList hits = lens.hit_all(Ray(Point3(0, 0, -20), Dir3(0, 0, 1)));
        REQUIRE(hits[0].world_normal().z == Catch::Approx(-1.0));
        REQUIRE_FALSE(hits[0].exiting);
        REQUIRE(hits[1].world_normal().z == Catch::Approx(1.0));
        REQUIRE(hits[1].exiting);
    }

    /// Off axis the faces sit back by the local sag.
    SECTION("Off-axis ray") {
        const std::vector<double> off = axial_hits(lens, 0.0, 4.0);
        const double sag = 10.0 - std::sqrt(100.0 - 16.0);
        REQUIRE(off.size() == 2);
        REQUIRE(off[0] == Catch::Approx(sag));
        REQUIRE(off[1] == Catch::Approx(5.0 - sag));
    }

    /// Derived geometry.
    SECTION("Geometry record") {
        REQUIRE(lens.front_thickness() == Catch::Approx(2.0));
        REQUIRE(lens.back_thickness() == Catch::Approx(2.0));
        REQUIRE(lens.edge_thickness() == Catch::Approx(1.0));
        REQUIRE(lens.kind() == "BiConvex");
        REQUIRE(lens.contains(Point3(0, 0, 2.5)));
        REQUIRE_FALSE(lens.contains(Point3(5.9, 0, 0.1)));
    }
}

/// Equal-curvature bi-convex lens: short below 2R - front sag - back sag, long above.
TEST_CASE("Short and long assembly", "[lens][short]") {
    const double R = 10.0, d = 12.0;
    const double threshold = 2.0 * R - 2.0 * (R - std::sqrt(R * R - 36.0));

    BiConvex thin(d, threshold - 1.0, R, R);
    BiConvex thick(d, threshold + 1.0, R, R);

    REQUIRE(thin.is_short());
    REQUIRE_FALSE(thick.is_short());

    /// Both branches bound the element by its center thickness along the axis.
    SECTION("Axial extent") {
        for (const Lens* lens : {static_cast<const Lens*>(&thin), static_cast<const Lens*>(&thick)}) {
            const BoundingBox box = lens->bounding_box();
            REQUIRE(box.extent(2) == Catch::Approx(lens->center_thickness()).margin(1e-6));
            REQUIRE(box.lower.z == Catch::Approx(0.0).margin(1e-6));
        }
    }

    /// The long branch still has exactly two axial hits.
    SECTION("Long lens hits") {
        const std::vector<double> z = axial_hits(thick);
        REQUIRE(z.size() == 2);
        REQUIRE(z[1] == Catch::Approx(threshold + 1.0));
    }

    /// The barrel shows between the faces of the long lens.
    SECTION("Long lens barrel") {
        const double mid = 0.5 * thick.center_thickness();
        const HitList hits = thick.hit_all(Ray(Point3(-10, 0, mid), Dir3(1, 0, 0)));
        REQUIRE(hits.size() == 2);
        REQUIRE(hits[0].t == Catch::Approx(4.0));
        REQUIRE(hits[0].normal.x == Catch::Approx(-1.0));
    }
}

/// Concave faces are carved out of the barrel.
TEST_CASE("Concave lenses", "[lens][spherical]") {
    /// Bi-concave lens: barrel spans both sags beyond the vertices.
    SECTION("Bi-concave") {
        BiConcave lens(12.0, 1.0, 10.0, 10.0);
        REQUIRE(lens.z_min() == Catch::Approx(-2.0));
        REQUIRE(lens.z_max() == Catch::Approx(3.0));
        REQUIRE(lens.edge_thickness() == Catch::Approx(5.0));
        const std::vector<double> z = axial_hits(lens);
        REQUIRE(z.size() == 2);
        REQUIRE(z[0] == Catch::Approx(0.0).margin(1e-9));
        REQUIRE(z[1] == Catch::Approx(1.0));
        REQUIRE_FALSE(lens.contains(Point3(0, 0, -0.5)));
        REQUIRE(lens.contains(Point3(5.5, 0, -1.0)));
    }

    /// Meniscus: concave back, convex front.
    SECTION("Meniscus") {
        Meniscus lens(12.0, 2.0, 10.0, 20.0);
        const std::vector<double> z = axial_hits(lens);
        REQUIRE(z.size() == 2);
        REQUIRE(z[0] == Catch::Approx(0.0).margin(1e-9));
        REQUIRE(z[1] == Catch::Approx(2.0));
        REQUIRE(lens.kind() == "Meniscus");
    }

    /// Plano-concave: flat back at z=0.
    SECTION("Plano-concave") {
        PlanoConcave lens(12.0, 1.0, 10.0);
        const std::vector<double> z = axial_hits(lens, 0.0, 3.0);
        REQUIRE(z.size() == 2);
        REQUIRE(z[0] == Catch::Approx(0.0).margin(1e-9));
        REQUIRE(z[1] == Catch::Approx(1.0 + 10.0 - std::sqrt(91.0)));
    }
}

/// Cylindrical faces curve in one plane only.
TEST_CASE("Cylindrical lenses", "[lens][cylindrical]") {
    const double sag4 = 10.0 - std::sqrt(84.0);

    /// Default curvature lies in the yz-plane.
    SECTION("Vertical") {
        CylindricalPlanoConvex lens(12.0, 5.0, 10.0);
        REQUIRE(lens.is_short());
        const std::vector<double> across = axial_hits(lens, 0.0, 4.0);
        REQUIRE(across.size() == 2);
        REQUIRE(across[1] == Catch::Approx(5.0 - sag4));
        const std::vector<double> along = axial_hits(lens, 4.0, 0.0);
        REQUIRE(along.size() == 2);
        REQUIRE(along[1] == Catch::Approx(5.0));
    }

    /// Horizontal curvature lies in the xz-plane.
    SECTION("Horizontal") {
        CylindricalPlanoConvex lens(12.0, 5.0, 10.0, true);
        const std::vector<double> across = axial_hits(lens, 4.0, 0.0);
        REQUIRE(across.size() == 2);
        REQUIRE(across[1] == Catch::Approx(5.0 - sag4));
    }

    /// Bi-convex cylinder lens in the long branch.
    SECTION("Long bi-convex") {
        CylindricalBiConvex lens(12.0, 9.0, 10.0, 10.0);
        REQUIRE_FALSE(lens.is_short());
        const std::vector<double> z = axial_hits(lens, 0.0, 4.0);
        REQUIRE(z.size() == 2);
        REQUIRE(z[0] == Catch::Approx(sag4));
        REQUIRE(z[1] == Catch::Approx(9.0 - sag4));
    }
}

/// Toric faces carry distinct vertical and horizontal curvatures.
TEST_CASE("Toric lenses", "[lens][toric]") {
    ToricPlanoConvex lens(12.0, 5.0, 10.0, 15.0);

    /// Each principal plane sees its own curvature.
    SECTION("Principal sections") {
        const std::vector<double> z0 = axial_hits(lens);
        REQUIRE(z0.size() == 2);
        REQUIRE(z0[0] == Catch::Approx(0.0).margin(1e-9));
        REQUIRE(z0[1] == Catch::Approx(5.0));

        const std::vector<double> vertical = axial_hits(lens, 0.0, 4.0);
        REQUIRE(vertical.size() == 2);
        REQUIRE(vertical[1] == Catch::Approx(5.0 - (10.0 - std::sqrt(84.0))));

        const std::vector<double> horizontal = axial_hits(lens, 4.0, 0.0);
        REQUIRE(horizontal.size() == 2);
        REQUIRE(horizontal[1] == Catch::Approx(5.0 - (15.0 - std::sqrt(209.0))));
    }

    /// The smaller curvature decides the torus orientation.
    SECTION("Geometry record") {
        REQUIRE(lens.front().curvature == Catch::Approx(10.0));
        REQUIRE(lens.front().major == Catch::Approx(5.0));
        REQUIRE(lens.front().rotation_deg == 0.0);
        ToricPlanoConvex turned(12.0, 5.0, 15.0, 10.0);
        REQUIRE(turned.front().rotation_deg == 90.0);
        const std::vector<double> vertical = axial_hits(turned, 0.0, 4.0);
        REQUIRE(vertical.size() == 2);
        REQUIRE(vertical[1] == Catch::Approx(5.0 - (15.0 - std::sqrt(209.0))));
    }
}

/// Impossible prescriptions fail before any solid is built.
TEST_CASE("Lens validation", "[lens][validation]") {
    REQUIRE_THROWS_AS(BiConvex(0.0, 5.0, 10.0, 10.0), GeometryError);
    REQUIRE_THROWS_AS(BiConvex(-12.0, 5.0, 10.0, 10.0), GeometryError);
    REQUIRE_THROWS_AS(BiConvex(12.0, 0.0, 10.0, 10.0), GeometryError);
    REQUIRE_THROWS_AS(BiConvex(12.0, 5.0, 5.0, 10.0), GeometryError);
    REQUIRE_THROWS_AS(BiConvex(12.0, 3.0, 10.0, 10.0), GeometryError);
    REQUIRE_THROWS_AS(PlanoConcave(12.0, -1.0, 10.0), GeometryError);
    REQUIRE_THROWS_AS(CylindricalMeniscus(12.0, 2.0, 4.0, 10.0), GeometryError);
    REQUIRE_THROWS_AS(ToricBiConvex(12.0, 5.0, 10.0, 10.0, 20.0, 30.0), GeometryError);
    REQUIRE_THROWS_AS(ToricBiConcave(12.0, 1.0, 10.0, 12.0, 5.0, 12.0), GeometryError);
}

/// Lenses are placed like any other primitive.
TEST_CASE("Placed lens", "[lens][transform]") {
    PlanoConvex lens(12.0, 5.0, 10.0);
    lens.set_transform(xform::translate(0, 0, 100) * xform::flip(5.0));

    const HitList hits = lens.hit_all(Ray(Point3(0, 0, 0), Dir3(0, 0, 1)));
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].t == Catch::Approx(100.0));
    REQUIRE(hits[1].t == Catch::Approx(105.0));
    REQUIRE(hits[1].world_normal().z == Catch::Approx(1.0));
}
