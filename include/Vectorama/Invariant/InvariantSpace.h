#pragma once

/**
 * @file InvariantSpace.h
 * @brief Invariant lines and planes of a 2x2 / 3x3 linear map
 *
 * Pipeline:
 *   Matrix -> characteristic roots -> real eigenvalues
 *          -> eigenvectors (one solver call per root instance, given the
 *             vectors already found for the same eigenvalue)
 *          -> eigenvalue groups -> InvariantLine / InvariantPlane records
 *
 * Per group:
 * - 1 eigenvector  -> InvariantLine along it
 * - 2 eigenvectors -> InvariantPlane with normal v1 x v2 (3x3 only)
 * - whole space    -> nothing (scalar multiples of I are filtered up front)
 *
 * All functions are pure and never throw for finite input; failures to
 * recover an eigenvector only reduce the number of returned objects.
 * Rendering scale, color and animation are left to the consumer.
 *
 * Example:
 * @code
 * Mat33 A{2, 0, 0,
 *         0, 2, 0,
 *         1, 1, 3};
 * auto objects = Assemble(A);   // one InvariantPlane (lambda = 2), one InvariantLine (lambda = 3)
 * @endcode
 */

#include <Vectorama/Core/Export.h>
#include <Vectorama/Internal/Matrix.h>
#include <Vectorama/Invariant/Degeneracy.h>

#include <string>
#include <variant>
#include <vector>

namespace Vectorama::Invariant {

using Internal::Vec2;
using Internal::Vec3;

// =============================================================================
// Invariant Objects
// =============================================================================

/**
 * @brief Line through the origin mapped onto itself (eigenspace of dimension 1)
 *
 * 2x2 results are embedded in the z = 0 plane.
 */
struct InvariantLine {
    Vec3 direction;             ///< Unit direction (sign is arbitrary)
    double eigenvalue = 0.0;    ///< Scale factor along the line
};

/**
 * @brief Plane through the origin mapped onto itself (eigenspace of dimension 2)
 */
struct InvariantPlane {
    Vec3 normal;                ///< Unit normal (sign is arbitrary)
    double eigenvalue = 0.0;    ///< Uniform scale factor within the plane
};

using InvariantObject = std::variant<InvariantLine, InvariantPlane>;

// =============================================================================
// Eigen Decomposition
// =============================================================================

/**
 * @brief Real eigenvalues grouped with their recovered eigenvectors
 *
 * Every real root instance increments its group's algebraic multiplicity.
 * The eigenvector solver is called once per root instance unless the group
 * already holds EigenspaceNullity() vectors or N vectors were found overall.
 * Groups whose eigenvectors could not be recovered are kept with Dimension() 0.
 */
VECTORAMA_API std::vector<EigenGroup2> ComputeEigenGroups(const Mat22& A);
VECTORAMA_API std::vector<EigenGroup3> ComputeEigenGroups(const Mat33& A);

/**
 * @brief Flattened (eigenvalue, eigenvector) pairs, in group order
 */
VECTORAMA_API std::vector<EigenPair2> ComputeEigenPairs(const Mat22& A);
VECTORAMA_API std::vector<EigenPair3> ComputeEigenPairs(const Mat33& A);

// =============================================================================
// Assembly
// =============================================================================

/**
 * @brief Invariant objects from already classified groups
 *
 * One object per group with 1 (line) or, for 3x3, 2 (plane) eigenvectors,
 * in group order. Groups of any other dimension produce nothing.
 */
VECTORAMA_API std::vector<InvariantObject> AssembleFromGroups(const std::vector<EigenGroup2>& groups);
VECTORAMA_API std::vector<InvariantObject> AssembleFromGroups(const std::vector<EigenGroup3>& groups);

/**
 * @brief Invariant lines and planes of A
 *
 * @param A 2x2 or 3x3 matrix with finite entries
 * @return Empty if A is a scalar multiple of I or has no real eigenvector
 */
VECTORAMA_API std::vector<InvariantObject> Assemble(const Mat22& A);
VECTORAMA_API std::vector<InvariantObject> Assemble(const Mat33& A);

// =============================================================================
// Utility Functions
// =============================================================================

inline bool IsLine(const InvariantObject& obj) {
    return std::holds_alternative<InvariantLine>(obj);
}

inline bool IsPlane(const InvariantObject& obj) {
    return std::holds_alternative<InvariantPlane>(obj);
}

/// Eigenvalue carried by a line or plane
VECTORAMA_API double EigenvalueOf(const InvariantObject& obj);

/// Line direction or plane normal
VECTORAMA_API Vec3 AxisOf(const InvariantObject& obj);

VECTORAMA_API int CountLines(const std::vector<InvariantObject>& objects);
VECTORAMA_API int CountPlanes(const std::vector<InvariantObject>& objects);

/**
 * @brief One-line human readable form, e.g. "Line dir=(1, 0, 0) lambda=2"
 */
VECTORAMA_API std::string Describe(const InvariantObject& obj);

} // namespace Vectorama::Invariant
