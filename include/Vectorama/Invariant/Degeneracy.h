#pragma once

/**
 * @file Degeneracy.h
 * @brief Degenerate spectrum handling: whole-space test, eigenvalue grouping
 *
 * This module provides:
 * - EigenPair / EigenGroup result types
 * - Scalar-multiple-of-identity detection (every direction is invariant)
 * - Grouping of eigen pairs by numerically equal eigenvalue
 * - Eigenspace nullity estimate used to cap repeated solver calls
 *
 * The dimension of a group is the number of independent eigenvectors the
 * solver actually recovered, not the algebraic multiplicity: a repeated
 * root with a one dimensional eigenspace (defective eigenvalue) yields a
 * group of size 1.
 */

#include <Vectorama/Core/Export.h>
#include <Vectorama/Internal/Matrix.h>

#include <vector>

namespace Vectorama::Invariant {

using Internal::Mat;
using Internal::Mat22;
using Internal::Mat33;
using Internal::Vec;

// =============================================================================
// Constants
// =============================================================================

/// Tolerance for the scalar-multiple-of-identity test
constexpr double WHOLE_SPACE_TOLERANCE = 1e-6;

/// Two eigenvalues closer than this belong to the same group
constexpr double EIGENVALUE_GROUP_TOLERANCE = 1e-6;

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief Real eigenvalue with one unit eigenvector
 */
template<int N>
struct EigenPair {
    double eigenvalue = 0.0;
    Vec<N> eigenvector;

    EigenPair() = default;
    EigenPair(double lambda, const Vec<N>& v) : eigenvalue(lambda), eigenvector(v) {}
};

/**
 * @brief All recovered eigenvectors of one eigenvalue
 */
template<int N>
struct EigenGroup {
    double eigenvalue = 0.0;              ///< Representative (first seen) value
    int algebraicMultiplicity = 0;        ///< Root count, 0 if built from pairs only
    std::vector<Vec<N>> eigenvectors;     ///< Mutually independent unit vectors

    /// Recovered eigenspace dimension
    int Dimension() const { return static_cast<int>(eigenvectors.size()); }

    /// Algebraic multiplicity exceeds the recovered dimension
    bool IsDefective() const { return algebraicMultiplicity > Dimension(); }
};

using EigenPair2 = EigenPair<2>;
using EigenPair3 = EigenPair<3>;
using EigenGroup2 = EigenGroup<2>;
using EigenGroup3 = EigenGroup<3>;

// =============================================================================
// Classification
// =============================================================================

/**
 * @brief True if A is a scalar multiple of the identity
 *
 * Off-diagonal entries within WHOLE_SPACE_TOLERANCE of zero and diagonal
 * entries within WHOLE_SPACE_TOLERANCE of each other. Every line and plane
 * through the origin is then invariant, so nothing specific is drawn.
 */
VECTORAMA_API bool IsWholeSpaceInvariant(const Mat22& A);
VECTORAMA_API bool IsWholeSpaceInvariant(const Mat33& A);

/**
 * @brief Group eigen pairs by eigenvalue
 *
 * Groups keep first-seen order; a pair joins the first group whose
 * representative eigenvalue is within tolerance. algebraicMultiplicity is
 * left at the number of pairs in the group.
 */
template<int N>
std::vector<EigenGroup<N>> GroupByEigenvalue(const std::vector<EigenPair<N>>& pairs,
                                             double tolerance = EIGENVALUE_GROUP_TOLERANCE);

/**
 * @brief Index of the group whose eigenvalue is within tolerance, or -1
 */
template<int N>
int FindGroup(const std::vector<EigenGroup<N>>& groups, double lambda,
              double tolerance = EIGENVALUE_GROUP_TOLERANCE);

/**
 * @brief Upper bound on the eigenspace dimension of lambda
 *
 * N - rank(A - lambda*I), with the rank estimated by the same row tests the
 * eigenvector solver uses. Always >= 1 since lambda is assumed to be an
 * eigenvalue.
 */
VECTORAMA_API int EigenspaceNullity(const Mat22& A, double lambda);
VECTORAMA_API int EigenspaceNullity(const Mat33& A, double lambda);

} // namespace Vectorama::Invariant
