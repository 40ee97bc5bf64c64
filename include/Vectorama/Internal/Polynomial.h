#pragma once

/**
 * @file Polynomial.h
 * @brief Closed-form roots of characteristic polynomials
 *
 * This module provides:
 * - Quadratic and cubic solvers returning (real, imag) root pairs
 * - Characteristic roots of 2x2 and 3x3 matrices, with multiplicity
 * - Real eigenvalue extraction (complex roots discarded)
 *
 * Used by:
 * - InvariantSpace.h (eigenvalues feeding the eigenvector solver)
 *
 * Design principles:
 * - No iteration: trigonometric / Cardano closed forms only
 * - Square root and arccos arguments are clamped against rounding
 * - Roots are always returned with multiplicity (2 for quadratic, 3 for cubic)
 */

#include <Vectorama/Core/Export.h>
#include <Vectorama/Internal/Matrix.h>

#include <array>
#include <cmath>
#include <vector>

namespace Vectorama::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Tolerance for discriminant signs and for classifying a root as complex
constexpr double POLY_COMPLEX_TOLERANCE = 1e-10;

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief One root of a real polynomial
 *
 * Complex roots of real polynomials come in conjugate pairs; both members
 * of a pair are reported (imag > 0 first).
 */
struct CharacteristicRoot {
    double real = 0.0;
    double imag = 0.0;

    CharacteristicRoot() = default;
    CharacteristicRoot(double re, double im) : real(re), imag(im) {}

    /// True if the imaginary part is within POLY_COMPLEX_TOLERANCE of zero
    bool IsReal() const { return std::abs(imag) <= POLY_COMPLEX_TOLERANCE; }
};

// =============================================================================
// Polynomial Roots
// =============================================================================

/**
 * @brief Roots of a*x^2 + b*x + c = 0
 *
 * Discriminant below -POLY_COMPLEX_TOLERANCE gives a conjugate pair,
 * otherwise two real roots (larger first) with the square root argument
 * clamped at zero.
 *
 * @throws InvalidArgumentException if a == 0
 */
VECTORAMA_API std::array<CharacteristicRoot, 2> SolveQuadratic(double a, double b, double c);

/**
 * @brief Roots of a*x^3 + b*x^2 + c*x + d = 0
 *
 * The cubic is normalized and depressed (x = t - b/3a) to t^3 + p*t + q.
 * With D = -(4p^3 + 27q^2) and tol = eps * max(1, 4|p|^3 + 27q^2):
 * - D >= -tol, p ~ 0: triple root
 * - D >= -tol: three real roots from the trigonometric form
 * - D < -tol: one real root + conjugate pair (Cardano)
 *
 * @throws InvalidArgumentException if a == 0
 */
VECTORAMA_API std::array<CharacteristicRoot, 3> SolveCubic(double a, double b, double c, double d);

// =============================================================================
// Characteristic Polynomials
// =============================================================================

/**
 * @brief Roots of det(A - lambda*I) for a 2x2 matrix
 *
 * lambda^2 - trace*lambda + det = 0
 */
VECTORAMA_API std::array<CharacteristicRoot, 2> CharacteristicRoots(const Mat22& A);

/**
 * @brief Roots of det(A - lambda*I) for a 3x3 matrix
 *
 * lambda^3 - trace*lambda^2 + (sum of principal 2x2 minors)*lambda - det = 0
 */
VECTORAMA_API std::array<CharacteristicRoot, 3> CharacteristicRoots(const Mat33& A);

/**
 * @brief Sum of the three principal 2x2 minors of a 3x3 matrix
 */
VECTORAMA_API double PrincipalMinorSum(const Mat33& A);

/**
 * @brief Real eigenvalues with multiplicity, in root order
 *
 * Empty for a 2x2 matrix with complex spectrum; a single value for a
 * 3x3 matrix with one real root and a conjugate pair.
 */
VECTORAMA_API std::vector<double> RealEigenvalues(const Mat22& A);
VECTORAMA_API std::vector<double> RealEigenvalues(const Mat33& A);

} // namespace Vectorama::Internal
