/**
 * @brief Root solver tests: cubic branches and labelling, companion-matrix quartic residuals,
 * and the near/far root selector.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <array>
#include <complex>
#include <limits>
#include <random>
#include <vector>
#include "roots.h"

namespace {

using cplx = std::complex<double>;

/// Monic coefficients (highest degree first) of the product of (x - r_i).
std::vector<cplx> expand(const std::vector<cplx>& roots) {
    std::vector<cplx> c{1.0};
    for (const cplx& r : roots) {
        std::vector<cplx> next(c.size() + 1, 0.0);
        for (size_t i = 0; i < c.size(); ++i) {
            next[i] += c[i];
            next[i + 1] -= r * c[i];
        }
        c = next;
    }
    return c;
}

/// |p(x)| relative to the sum of |a_i x^i|.
double relative_residual(const std::vector<double>& c, const cplx& x) {
    cplx p = 0.0;
    double scale = 0.0;
    for (double ci : c) {
        p = p * x + ci;
        scale = scale * std::abs(x) + std::abs(ci);
    }
    return scale > 0.0 ? std::abs(p) / scale : std::abs(p);
}

std::vector<double> real_parts(const std::vector<cplx>& c) {
    std::vector<double> out;
    for (const cplx& v : c) out.push_back(v.real());
    return out;
}

} // anon

/// Three real roots come back as (middle, smallest, largest) for distinct roots.
TEST_CASE("Cubic with three real roots", "[roots][cubic]") {
    double r0 = 0, r1 = 0, r2 = 0;
    // (x-1)(x-2)(x-3)
    REQUIRE(solve_cubic(1.0, -6.0, 11.0, -6.0, r0, r1, r2));
    REQUIRE(r0 == Catch::Approx(2.0));
    REQUIRE(r1 == Catch::Approx(1.0));
    REQUIRE(r2 == Catch::Approx(3.0));

    /// The labelling does not depend on the leading coefficient.
    SECTION("Scaled coefficients") {
        double s0 = 0, s1 = 0, s2 = 0;
        REQUIRE(solve_cubic(-2.0, 12.0, -22.0, 12.0, s0, s1, s2));
        REQUIRE(s0 == Catch::Approx(r0));
        REQUIRE(s1 == Catch::Approx(r1));
        REQUIRE(s2 == Catch::Approx(r2));
    }

    /// x^3 has a triple root at 0.
    SECTION("Triple root") {
        double t0 = 1, t1 = 1, t2 = 1;
        REQUIRE(solve_cubic(1.0, 0.0, 0.0, 0.0, t0, t1, t2));
        REQUIRE(t0 == Catch::Approx(0.0).margin(1e-12));
        REQUIRE(t2 == Catch::Approx(0.0).margin(1e-12));
    }
}

/// One real root plus a complex pair reports all_real = false with the real root in slot 0.
TEST_CASE("Cubic with a complex pair", "[roots][cubic]") {
    double r0 = 0, r1 = 0, r2 = 0;
    // (x-2)(x^2+1)
    REQUIRE_FALSE(solve_cubic(1.0, -2.0, 1.0, -2.0, r0, r1, r2));
    REQUIRE(r0 == Catch::Approx(2.0));
    REQUIRE(r1 == Catch::Approx(0.0).margin(1e-12));
}

/// Random cubics built from known roots satisfy the polynomial to a relative residual of 1e-9.
TEST_CASE("Cubic residuals for random roots", "[roots][cubic]") {
    std::mt19937 rng(20240611);
    std::uniform_real_distribution<double> val(-5.0, 5.0);
    std::uniform_real_distribution<double> imag(0.5, 3.0);

    for (int trial = 0; trial < 200; ++trial) {
        const bool all_real = (trial % 2 == 0);
        std::vector<cplx> roots;
        if (all_real) {
            roots = {val(rng), val(rng), val(rng)};
        } else {
            const double re = val(rng), im = imag(rng);
            roots = {val(rng), cplx(re, im), cplx(re, -im)};
        }
        const std::vector<double> c = real_parts(expand(roots));

        double r0 = 0, r1 = 0, r2 = 0;
        const bool got_real = solve_cubic(c[0], c[1], c[2], c[3], r0, r1, r2);
        REQUIRE(got_real == all_real);
        REQUIRE(relative_residual(c, r0) < 1e-9);
        if (all_real) {
            REQUIRE(relative_residual(c, r1) < 1e-9);
            REQUIRE(relative_residual(c, r2) < 1e-9);
        }
    }
}

/// Random quartics from real and complex roots: small residuals and a correct all_real flag.
TEST_CASE("Quartic residuals for random roots", "[roots][quartic]") {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> val(-5.0, 5.0);
    std::uniform_real_distribution<double> imag(0.5, 3.0);

    for (int trial = 0; trial < 300; ++trial) {
        const int pairs = trial % 3;  // 0, 1 or 2 complex pairs
        std::vector<cplx> roots;
        for (int p = 0; p < pairs; ++p) {
            const double re = val(rng), im = imag(rng);
            roots.push_back(cplx(re, im));
            roots.push_back(cplx(re, -im));
        }
        while (roots.size() < 4) roots.push_back(val(rng));
        const std::vector<double> c = real_parts(expand(roots));

        std::array<cplx, 4> found;
        const bool all_real = solve_quartic(c[0], c[1], c[2], c[3], c[4], found);
        REQUIRE(all_real == (pairs == 0));
        for (const cplx& z : found) {
            REQUIRE(relative_residual(c, z) < 1e-9);
        }
    }
}

/// The quartic accepts a non-unit leading coefficient.
TEST_CASE("Quartic with known real roots", "[roots][quartic]") {
    // 2(x+2)(x+1)(x-1)(x-3)
    const std::vector<double> c = real_parts(expand({-2.0, -1.0, 1.0, 3.0}));
    std::array<cplx, 4> found;
    REQUIRE(solve_quartic(2 * c[0], 2 * c[1], 2 * c[2], 2 * c[3], 2 * c[4], found));

    std::array<double, 4> re{};
    REQUIRE(collect_real_roots(found, re) == 4);
    std::sort(re.begin(), re.end());
    REQUIRE(re[0] == Catch::Approx(-2.0));
    REQUIRE(re[1] == Catch::Approx(-1.0));
    REQUIRE(re[2] == Catch::Approx(1.0));
    REQUIRE(re[3] == Catch::Approx(3.0));
}

/// pick_two_roots keeps real roots only and returns the smallest and largest.
TEST_CASE("Near and far root selection", "[roots][select]") {
    /// Two real roots among complex ones.
    SECTION("Mixed roots") {
        std::array<cplx, 4> roots{cplx(4.0, 0.0), cplx(1.0, 2.0), cplx(1.0, -2.0), cplx(-0.5, 0.0)};
        double near = 0, far = 0;
        REQUIRE(pick_two_roots(roots, near, far));
        REQUIRE(near == Catch::Approx(-0.5));
        REQUIRE(far == Catch::Approx(4.0));
    }

    /// A single real root is not enough.
    SECTION("Too few real roots") {
        std::array<cplx, 4> roots{cplx(4.0, 0.0), cplx(1.0, 2.0), cplx(1.0, -2.0), cplx(2.0, 1.0)};
        double near = 0, far = 0;
        REQUIRE_FALSE(pick_two_roots(roots, near, far));
    }

    /// The tolerance is relative to the real part.
    SECTION("Scale-relative tolerance") {
        std::array<cplx, 4> roots{cplx(1000.0, 1e-4), cplx(2000.0, -1e-4), cplx(1.0, 1e-4), cplx(0.0, 5.0)};
        std::array<double, 4> re{};
        REQUIRE(collect_real_roots(roots, re, 1e-6) == 2);
        double near = 0, far = 0;
        REQUIRE(pick_two_roots(roots, near, far, 1e-6));
        REQUIRE(near == Catch::Approx(1000.0));
        REQUIRE(far == Catch::Approx(2000.0));
    }

    /// NaN roots are ignored.
    SECTION("NaN roots") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        std::array<cplx, 4> roots{cplx(nan, 0.0), cplx(1.0, 0.0), cplx(nan, nan), cplx(3.0, 0.0)};
        double near = 0, far = 0;
        REQUIRE(pick_two_roots(roots, near, far));
        REQUIRE(near == Catch::Approx(1.0));
        REQUIRE(far == Catch::Approx(3.0));
    }
}
