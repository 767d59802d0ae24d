#include "roots.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <Eigen/Dense>

namespace {

constexpr double kTwoPi = 6.28318530717958647692;

/// Horner evaluation of p and p' at z (coefficients highest degree first).
void eval_poly(const std::array<double, 5>& c, const std::complex<double>& z,
               std::complex<double>& p, std::complex<double>& dp) {
    p = c[0];
    dp = 0.0;
    for (size_t i = 1; i < c.size(); ++i) {
        dp = dp * z + p;
        p = p * z + c[i];
    }
}

/// Newton refinement kept only while the residual shrinks.
std::complex<double> polish(const std::array<double, 5>& c, std::complex<double> z) {
    std::complex<double> p, dp;
    eval_poly(c, z, p, dp);
    for (int it = 0; it < 4; ++it) {
        if (std::abs(dp) == 0.0) break;
        const std::complex<double> next = z - p / dp;
        std::complex<double> pn, dpn;
        eval_poly(c, next, pn, dpn);
        if (!(std::abs(pn) < std::abs(p))) break;
        z = next;
        p = pn;
        dp = dpn;
    }
    return z;
}

} // anon

bool solve_cubic(double a3, double a2, double a1, double a0,
                 double& r0, double& r1, double& r2) {
    const double A = a2 / a3;
    const double B = a1 / a3;
    const double C = a0 / a3;

    const double q = (3.0 * B - A * A) / 9.0;
    const double r = (9.0 * A * B - 27.0 * C - 2.0 * A * A * A) / 54.0;
    const double d = q * q * q + r * r;
    const double shift = A / 3.0;

    if (d > 0.0) {
        const double sd = std::sqrt(d);
        const double s = std::cbrt(r + sd);
        const double t = std::cbrt(r - sd);
        r0 = s + t - shift;
        r1 = -0.5 * (s + t) - shift;
        r2 = r1;
        return false;
    }

    if (q == 0.0) {
        // triple root
        r0 = r1 = r2 = -shift;
        return true;
    }

    const double m = 2.0 * std::sqrt(-q);
    const double cos_arg = std::max(-1.0, std::min(1.0, r / std::sqrt(-q * q * q)));
    const double theta = std::acos(cos_arg);

    const double phi1 = m * std::cos(theta / 3.0) - shift;
    const double phi2 = m * std::cos((theta + kTwoPi) / 3.0) - shift;
    const double phi3 = m * std::cos((theta + 2.0 * kTwoPi) / 3.0) - shift;

    r0 = phi3;
    r1 = phi2;
    r2 = phi1;
    return true;
}

bool solve_quartic(double a4, double a3, double a2, double a1, double a0,
                   std::array<std::complex<double>, 4>& roots,
                   double rel_tol) {
    const std::array<double, 5> monic{1.0, a3 / a4, a2 / a4, a1 / a4, a0 / a4};

    Eigen::Matrix4d companion = Eigen::Matrix4d::Zero();
    companion(0, 0) = -monic[1];
    companion(0, 1) = -monic[2];
    companion(0, 2) = -monic[3];
    companion(0, 3) = -monic[4];
    companion(1, 0) = 1.0;
    companion(2, 1) = 1.0;
    companion(3, 2) = 1.0;

    Eigen::EigenSolver<Eigen::Matrix4d> solver(companion, false);
    if (solver.info() != Eigen::Success) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        roots.fill(std::complex<double>(nan, nan));
        return false;
    }

    const auto eig = solver.eigenvalues();
    double scale = 0.0;
    for (int i = 0; i < 4; ++i) {
        roots[i] = polish(monic, eig(i));
        scale = std::max(scale, std::abs(roots[i]));
    }

    bool all_real = true;
    for (const auto& z : roots) {
        if (std::abs(z.imag()) > rel_tol * scale) all_real = false;
    }
    return all_real;
}

int collect_real_roots(const std::array<std::complex<double>, 4>& roots,
                       std::array<double, 4>& out,
                       double rel_tol) {
    int count = 0;
    for (const auto& z : roots) {
        const double re = z.real();
        if (std::isnan(re) || std::isnan(z.imag())) continue;
        if (std::abs(z.imag()) > rel_tol * std::abs(re)) continue;
        out[count++] = re;
    }
    return count;
}

bool pick_two_roots(const std::array<std::complex<double>, 4>& roots,
                    double& near, double& far,
                    double rel_tol) {
    std::array<double, 4> real{};
    const int count = collect_real_roots(roots, real, rel_tol);
    if (count < 2) return false;
    near = *std::min_element(real.begin(), real.begin() + count);
    far = *std::max_element(real.begin(), real.begin() + count);
    return true;
}
