/**
 * @file Polynomial.cpp
 * @brief Quadratic / cubic root finding for characteristic polynomials
 */

#include <Vectorama/Internal/Polynomial.h>
#include <Vectorama/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace Vectorama::Internal {

namespace {
    constexpr double PI = 3.14159265358979323846;
    constexpr double EPSILON = POLY_COMPLEX_TOLERANCE;

    template<size_t K>
    std::vector<double> RealParts(const std::array<CharacteristicRoot, K>& roots) {
        std::vector<double> values;
        values.reserve(K);
        for (const auto& root : roots) {
            if (root.IsReal()) {
                values.push_back(root.real);
            }
        }
        return values;
    }
}

// =============================================================================
// Polynomial Roots
// =============================================================================

std::array<CharacteristicRoot, 2> SolveQuadratic(double a, double b, double c) {
    if (a == 0.0) {
        throw InvalidArgumentException("SolveQuadratic: leading coefficient is zero");
    }

    double B = b / a;
    double C = c / a;
    double discriminant = B * B - 4.0 * C;

    if (discriminant < -EPSILON) {
        double re = -B / 2.0;
        double im = std::sqrt(-discriminant) / 2.0;
        return {CharacteristicRoot(re, im), CharacteristicRoot(re, -im)};
    }

    // Rounding can push a double root slightly negative
    double sqrtDisc = std::sqrt(std::max(0.0, discriminant));
    return {CharacteristicRoot((-B + sqrtDisc) / 2.0, 0.0),
            CharacteristicRoot((-B - sqrtDisc) / 2.0, 0.0)};
}

std::array<CharacteristicRoot, 3> SolveCubic(double a, double b, double c, double d) {
    if (a == 0.0) {
        throw InvalidArgumentException("SolveCubic: leading coefficient is zero");
    }

    b /= a;
    c /= a;
    d /= a;

    // Depressed cubic t^3 + p*t + q = 0 with x = t - b/3
    double p = c - b * b / 3.0;
    double q = 2.0 * b * b * b / 27.0 - b * c / 3.0 + d;
    double shift = -b / 3.0;

    double discriminant = -(4.0 * p * p * p + 27.0 * q * q);

    // D is a difference of terms of size |4p^3| + 27q^2; a double root
    // leaves rounding noise proportional to that size, not to 1.
    double scale = 4.0 * std::abs(p * p * p) + 27.0 * q * q;
    double tolerance = EPSILON * std::max(1.0, scale);

    if (discriminant >= -tolerance) {
        // p > 0 within the tolerance only happens for a
        // numerically triple root; sqrt(-p/3) would be NaN there.
        if (std::abs(p) < EPSILON || p > 0.0) {
            double root = std::cbrt(-q) + shift;
            return {CharacteristicRoot(root, 0.0),
                    CharacteristicRoot(root, 0.0),
                    CharacteristicRoot(root, 0.0)};
        }

        double m = std::sqrt(-p / 3.0);
        double cosArg = -q / (2.0 * m * m * m);
        cosArg = std::clamp(cosArg, -1.0, 1.0);
        double theta = std::acos(cosArg) / 3.0;

        std::array<CharacteristicRoot, 3> roots;
        for (int k = 0; k < 3; ++k) {
            roots[k] = CharacteristicRoot(2.0 * m * std::cos(theta - 2.0 * PI * k / 3.0) + shift, 0.0);
        }
        return roots;
    }

    // One real root, complex conjugate pair
    double sqrtTerm = std::sqrt(-discriminant / 108.0);
    double A = std::cbrt(-q / 2.0 + sqrtTerm);
    double B = std::cbrt(-q / 2.0 - sqrtTerm);

    double realRoot = A + B + shift;
    double re = -(A + B) / 2.0 + shift;
    double im = std::abs(A - B) * std::sqrt(3.0) / 2.0;

    return {CharacteristicRoot(realRoot, 0.0),
            CharacteristicRoot(re, im),
            CharacteristicRoot(re, -im)};
}

// =============================================================================
// Characteristic Polynomials
// =============================================================================

std::array<CharacteristicRoot, 2> CharacteristicRoots(const Mat22& A) {
    double trace = A.Trace();
    double det = A.Determinant();
    return SolveQuadratic(1.0, -trace, det);
}

double PrincipalMinorSum(const Mat33& A) {
    double m00 = A(1, 1) * A(2, 2) - A(1, 2) * A(2, 1);
    double m11 = A(0, 0) * A(2, 2) - A(0, 2) * A(2, 0);
    double m22 = A(0, 0) * A(1, 1) - A(0, 1) * A(1, 0);
    return m00 + m11 + m22;
}

std::array<CharacteristicRoot, 3> CharacteristicRoots(const Mat33& A) {
    double trace = A.Trace();
    double minors = PrincipalMinorSum(A);
    double det = A.Determinant();
    return SolveCubic(1.0, -trace, minors, -det);
}

std::vector<double> RealEigenvalues(const Mat22& A) {
    return RealParts(CharacteristicRoots(A));
}

std::vector<double> RealEigenvalues(const Mat33& A) {
    return RealParts(CharacteristicRoots(A));
}

} // namespace Vectorama::Internal
