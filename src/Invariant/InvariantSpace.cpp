/**
 * @file InvariantSpace.cpp
 * @brief Eigen pair computation and invariant line / plane assembly
 */

#include <Vectorama/Invariant/InvariantSpace.h>
#include <Vectorama/Internal/EigenVector.h>
#include <Vectorama/Internal/Polynomial.h>

#include <cstdio>

namespace Vectorama::Invariant {

namespace {
    // Cross product of two independent unit vectors has norm >= ~0.14;
    // anything much smaller means the pair was not a plane basis
    constexpr double MIN_PLANE_NORMAL_SQ = 0.01;

    template<int N>
    std::vector<EigenGroup<N>> SolveGroups(const Mat<N>& A) {
        std::vector<EigenGroup<N>> groups;
        int total = 0;

        for (double lambda : Internal::RealEigenvalues(A)) {
            int idx = FindGroup(groups, lambda);
            if (idx < 0) {
                EigenGroup<N> group;
                group.eigenvalue = lambda;
                groups.push_back(group);
                idx = static_cast<int>(groups.size()) - 1;
            }

            EigenGroup<N>& group = groups[idx];
            group.algebraicMultiplicity++;

            // Solve against the representative so every pair of the group
            // satisfies the residual bound for the eigenvalue it reports
            if (total >= N || group.Dimension() >= EigenspaceNullity(A, group.eigenvalue)) {
                continue;
            }

            auto v = Internal::EigenVector(A, group.eigenvalue, group.eigenvectors);
            if (v) {
                group.eigenvectors.push_back(*v);
                ++total;
            }
        }
        return groups;
    }

    template<int N>
    std::vector<EigenPair<N>> Flatten(const std::vector<EigenGroup<N>>& groups) {
        std::vector<EigenPair<N>> pairs;
        for (const auto& group : groups) {
            for (const auto& v : group.eigenvectors) {
                pairs.emplace_back(group.eigenvalue, v);
            }
        }
        return pairs;
    }

    std::string FormatValue(double val) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.4g", val);
        return buf;
    }

    std::string FormatVec(const Vec3& v) {
        return "(" + FormatValue(v[0]) + ", " + FormatValue(v[1]) + ", " + FormatValue(v[2]) + ")";
    }
}

// =============================================================================
// Eigen Decomposition
// =============================================================================

std::vector<EigenGroup2> ComputeEigenGroups(const Mat22& A) {
    return SolveGroups(A);
}

std::vector<EigenGroup3> ComputeEigenGroups(const Mat33& A) {
    return SolveGroups(A);
}

std::vector<EigenPair2> ComputeEigenPairs(const Mat22& A) {
    return Flatten(ComputeEigenGroups(A));
}

std::vector<EigenPair3> ComputeEigenPairs(const Mat33& A) {
    return Flatten(ComputeEigenGroups(A));
}

// =============================================================================
// Assembly
// =============================================================================

std::vector<InvariantObject> AssembleFromGroups(const std::vector<EigenGroup2>& groups) {
    std::vector<InvariantObject> objects;
    for (const auto& group : groups) {
        // Two independent eigenvectors in the plane: whole space, nothing to draw
        if (group.Dimension() == 1) {
            objects.push_back(InvariantLine{Internal::Lift(group.eigenvectors[0]), group.eigenvalue});
        }
    }
    return objects;
}

std::vector<InvariantObject> AssembleFromGroups(const std::vector<EigenGroup3>& groups) {
    std::vector<InvariantObject> objects;
    for (const auto& group : groups) {
        if (group.Dimension() == 1) {
            objects.push_back(InvariantLine{group.eigenvectors[0], group.eigenvalue});
        } else if (group.Dimension() == 2) {
            Vec3 normal = Internal::Cross(group.eigenvectors[0], group.eigenvectors[1]);
            if (normal.NormSquared() > MIN_PLANE_NORMAL_SQ) {
                objects.push_back(InvariantPlane{normal.Normalized(), group.eigenvalue});
            }
        }
    }
    return objects;
}

std::vector<InvariantObject> Assemble(const Mat22& A) {
    if (IsWholeSpaceInvariant(A)) {
        return {};
    }
    return AssembleFromGroups(ComputeEigenGroups(A));
}

std::vector<InvariantObject> Assemble(const Mat33& A) {
    if (IsWholeSpaceInvariant(A)) {
        return {};
    }
    return AssembleFromGroups(ComputeEigenGroups(A));
}

// =============================================================================
// Utility Functions
// =============================================================================

double EigenvalueOf(const InvariantObject& obj) {
    return std::visit([](const auto& o) { return o.eigenvalue; }, obj);
}

Vec3 AxisOf(const InvariantObject& obj) {
    if (const auto* line = std::get_if<InvariantLine>(&obj)) {
        return line->direction;
    }
    return std::get<InvariantPlane>(obj).normal;
}

int CountLines(const std::vector<InvariantObject>& objects) {
    int count = 0;
    for (const auto& obj : objects) {
        if (IsLine(obj)) ++count;
    }
    return count;
}

int CountPlanes(const std::vector<InvariantObject>& objects) {
    int count = 0;
    for (const auto& obj : objects) {
        if (IsPlane(obj)) ++count;
    }
    return count;
}

std::string Describe(const InvariantObject& obj) {
    if (const auto* line = std::get_if<InvariantLine>(&obj)) {
        return "Line dir=" + FormatVec(line->direction) + " lambda=" + FormatValue(line->eigenvalue);
    }
    const auto& plane = std::get<InvariantPlane>(obj);
    return "Plane normal=" + FormatVec(plane.normal) + " lambda=" + FormatValue(plane.eigenvalue);
}

} // namespace Vectorama::Invariant
