/**
 * @file Degeneracy.cpp
 * @brief Whole-space detection and eigenvalue grouping
 */

#include <Vectorama/Invariant/Degeneracy.h>
#include <Vectorama/Internal/EigenVector.h>

#include <cmath>

namespace Vectorama::Invariant {

namespace {
    template<int N>
    bool IsScalarIdentity(const Mat<N>& A) {
        for (int i = 0; i < N; ++i) {
            for (int j = 0; j < N; ++j) {
                if (i != j && std::abs(A(i, j)) >= WHOLE_SPACE_TOLERANCE) {
                    return false;
                }
            }
        }
        for (int i = 1; i < N; ++i) {
            if (std::abs(A(i, i) - A(0, 0)) >= WHOLE_SPACE_TOLERANCE) {
                return false;
            }
        }
        return true;
    }
}

bool IsWholeSpaceInvariant(const Mat22& A) {
    return IsScalarIdentity(A);
}

bool IsWholeSpaceInvariant(const Mat33& A) {
    return IsScalarIdentity(A);
}

template<int N>
int FindGroup(const std::vector<EigenGroup<N>>& groups, double lambda, double tolerance) {
    for (size_t i = 0; i < groups.size(); ++i) {
        if (std::abs(groups[i].eigenvalue - lambda) < tolerance) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

template<int N>
std::vector<EigenGroup<N>> GroupByEigenvalue(const std::vector<EigenPair<N>>& pairs,
                                             double tolerance) {
    std::vector<EigenGroup<N>> groups;
    for (const auto& pair : pairs) {
        int idx = FindGroup(groups, pair.eigenvalue, tolerance);
        if (idx < 0) {
            EigenGroup<N> group;
            group.eigenvalue = pair.eigenvalue;
            groups.push_back(group);
            idx = static_cast<int>(groups.size()) - 1;
        }
        groups[idx].eigenvectors.push_back(pair.eigenvector);
        groups[idx].algebraicMultiplicity++;
    }
    return groups;
}

template int FindGroup<2>(const std::vector<EigenGroup2>&, double, double);
template int FindGroup<3>(const std::vector<EigenGroup3>&, double, double);
template std::vector<EigenGroup2> GroupByEigenvalue<2>(const std::vector<EigenPair2>&, double);
template std::vector<EigenGroup3> GroupByEigenvalue<3>(const std::vector<EigenPair3>&, double);

int EigenspaceNullity(const Mat22& A, double lambda) {
    return 2 - Internal::SingularRank(A.Shifted(lambda));
}

int EigenspaceNullity(const Mat33& A, double lambda) {
    return 3 - Internal::SingularRank(A.Shifted(lambda));
}

} // namespace Vectorama::Invariant
