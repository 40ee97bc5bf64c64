#pragma once

/**
 * @file EigenVector.h
 * @brief Unit eigenvectors of 2x2 / 3x3 matrices for a known real eigenvalue
 *
 * This module provides:
 * - Closed-form 2x2 eigenvector with diagonal / axis fallbacks
 * - 3x3 null space extraction of (A - lambda*I) via an ordered list of
 *   strategies (whole space, plane, row cross products, elimination)
 * - Validation shared by every strategy (unit length, residual, independence)
 *
 * Repeated eigenvalues are handled by calling the solver again with the
 * vectors already found for that eigenvalue; the solver then returns a
 * vector independent of them, or nothing.
 *
 * Used by:
 * - InvariantSpace.h (one call per eigenvalue root instance)
 * - Degeneracy.h (shifted rank estimation reuses the row tests)
 */

#include <Vectorama/Core/Export.h>
#include <Vectorama/Internal/Matrix.h>

#include <array>
#include <optional>
#include <vector>

namespace Vectorama::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Maximum ||(A - lambda*I) v|| for an accepted eigenvector
constexpr double EIGENVECTOR_RESIDUAL_TOLERANCE = 0.01;

/// |cos| above which two unit vectors are considered the same direction
constexpr double EIGENVECTOR_PARALLEL_THRESHOLD = 0.99;

/// Allowed deviation of an accepted eigenvector's norm from 1
constexpr double EIGENVECTOR_UNIT_TOLERANCE = 1e-6;

/// Squared norm below which a row of (A - lambda*I) is treated as zero (3x3)
constexpr double EIGENVECTOR_ZERO_ROW_TOLERANCE = 1e-8;

/// Magnitude below which a 2x2 coefficient or a 2x2 minor is treated as zero
constexpr double EIGENVECTOR_COEFF_TOLERANCE = 1e-10;

// =============================================================================
// Validation
// =============================================================================

/**
 * @brief Check that v is independent of every vector in found
 *
 * Requires |v . f| <= EIGENVECTOR_PARALLEL_THRESHOLD for each f, and that
 * v keeps a component of at least sqrt(1 - 0.99^2) outside span(found),
 * so three vectors lying in one plane are never reported as independent.
 * Returns false once found already spans R^N.
 */
template<int N>
bool IsIndependentOf(const Vec<N>& v, const std::vector<Vec<N>>& found);

/**
 * @brief Full acceptance test for a candidate eigenvector
 *
 * @param shifted A - lambda*I
 * @param v Candidate (must already be normalized)
 * @param found Vectors already accepted for the same eigenvalue
 * @return True if unit length, residual below tolerance and independent
 */
template<int N>
bool IsAcceptedEigenVector(const Mat<N>& shifted, const Vec<N>& v,
                           const std::vector<Vec<N>>& found);

// =============================================================================
// 2x2 Eigenvector
// =============================================================================

/**
 * @brief Unit eigenvector of a 2x2 matrix for a real eigenvalue
 *
 * For A = [a b; c d], candidates are tried in order:
 * (b, lambda - a) if |b| > eps, (lambda - d, c) if |c| > eps,
 * (0, 1) if |a - lambda| > eps, (1, 0) if |d - lambda| > eps,
 * and when A - lambda*I is ~0 the x axis or the perpendicular of the
 * first found vector. The first candidate passing IsAcceptedEigenVector wins.
 *
 * @param A 2x2 matrix
 * @param lambda Real eigenvalue of A
 * @param found Eigenvectors already found for lambda
 * @return Unit eigenvector, or std::nullopt if none independent of found
 */
VECTORAMA_API std::optional<Vec2> EigenVector(const Mat22& A, double lambda,
                                              const std::vector<Vec2>& found = {});

// =============================================================================
// 3x3 Eigenvector
// =============================================================================

/**
 * @brief A null vector strategy over M = A - lambda*I
 *
 * Returns a vector that already passed IsAcceptedEigenVector, or nullopt
 * when the strategy does not apply or none of its candidates validate.
 */
using NullVectorStrategy = std::optional<Vec3> (*)(const Mat33& shifted,
                                                   const std::vector<Vec3>& found);

/**
 * @brief All rows of M ~0: the eigenspace is R^3
 *
 * First call gives the x axis, the second an axis crossed with found[0],
 * the third found[0] x found[1].
 */
VECTORAMA_API std::optional<Vec3> NullVectorWholeSpace(const Mat33& shifted,
                                                       const std::vector<Vec3>& found);

/**
 * @brief Nonzero rows of M mutually parallel: the eigenspace is a plane
 *
 * The largest nonzero row is the plane normal. Candidates are normal x f for
 * each found f, then the in-plane vectors axis x normal.
 */
VECTORAMA_API std::optional<Vec3> NullVectorPlane(const Mat33& shifted,
                                                  const std::vector<Vec3>& found);

/**
 * @brief Pairwise cross products of the nonzero rows of M
 */
VECTORAMA_API std::optional<Vec3> NullVectorCrossProduct(const Mat33& shifted,
                                                         const std::vector<Vec3>& found);

/**
 * @brief Direct elimination
 *
 * Over every pair of nonzero rows, picks the coordinate whose complementary
 * 2x2 minor has the largest magnitude, fixes it to 1 and solves the
 * remaining 2x2 system by Cramer's rule.
 */
VECTORAMA_API std::optional<Vec3> NullVectorElimination(const Mat33& shifted,
                                                        const std::vector<Vec3>& found);

/**
 * @brief Strategies in the order EigenVector(Mat33) tries them
 */
VECTORAMA_API const std::array<NullVectorStrategy, 4>& NullVectorStrategies();

/**
 * @brief Unit eigenvector of a 3x3 matrix for a real eigenvalue
 *
 * Runs NullVectorStrategies() on A - lambda*I and returns the first result.
 *
 * @param A 3x3 matrix
 * @param lambda Real eigenvalue of A
 * @param found Eigenvectors already found for lambda
 * @return Unit eigenvector, or std::nullopt if no strategy validates
 */
VECTORAMA_API std::optional<Vec3> EigenVector(const Mat33& A, double lambda,
                                              const std::vector<Vec3>& found = {});

// =============================================================================
// Row Analysis
// =============================================================================

/**
 * @brief Rank of a singular shifted matrix, estimated from its rows
 *
 * 2x2: 0 if every entry is within EIGENVECTOR_COEFF_TOLERANCE of zero, else 1.
 * 3x3: 0 if every row is ~0, 1 if the nonzero rows are mutually parallel,
 * else 2. The matrix is assumed singular (lambda is an eigenvalue), so
 * full rank is never reported.
 */
VECTORAMA_API int SingularRank(const Mat22& shifted);
VECTORAMA_API int SingularRank(const Mat33& shifted);

} // namespace Vectorama::Internal
