#pragma once
#include <array>
#include <complex>

/// Default relative tolerance for treating a complex root as real.
constexpr double kRootImagTolerance = 1e-6;

/**
 * @brief Roots of a3·x³ + a2·x² + a1·x + a0 = 0 (a3 != 0).
 * Three real roots come back in the trigonometric branch order k=2, k=1, k=0.
 * With one real root it is in @p r0 and @p r1/@p r2 hold the real part of the complex pair.
 * @return true if all three roots are real.
 */
bool solve_cubic(double a3, double a2, double a1, double a0,
                 double& r0, double& r1, double& r2);

/**
 * @brief Roots of a4·x⁴ + a3·x³ + a2·x² + a1·x + a0 = 0 (a4 != 0).
 * Eigenvalues of the companion matrix, each refined by Newton steps that reduce the residual.
 * @param roots Output, four complex roots in no particular order.
 * @param rel_tol Imaginary parts below rel_tol × (largest root magnitude) count as zero.
 * @return true if all four roots are real.
 */
bool solve_quartic(double a4, double a3, double a2, double a1, double a0,
                   std::array<std::complex<double>, 4>& roots,
                   double rel_tol = kRootImagTolerance);

/**
 * @brief Real parts of the roots that count as real.
 * A root is real when |imag| <= rel_tol·|real| and neither part is NaN.
 * @param out Surviving real values, unordered.
 * @return Number of values written to @p out.
 */
int collect_real_roots(const std::array<std::complex<double>, 4>& roots,
                       std::array<double, 4>& out,
                       double rel_tol = kRootImagTolerance);

/**
 * @brief Smallest and largest real roots among @p roots.
 * @param near Smallest surviving real value.
 * @param far Largest surviving real value.
 * @return false if fewer than two roots survive.
 */
bool pick_two_roots(const std::array<std::complex<double>, 4>& roots,
                    double& near, double& far,
                    double rel_tol = kRootImagTolerance);
