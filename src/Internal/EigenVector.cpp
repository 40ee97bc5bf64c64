/**
 * @file EigenVector.cpp
 * @brief Null space extraction for 2x2 / 3x3 shifted matrices
 */

#include <Vectorama/Internal/EigenVector.h>

#include <cmath>

namespace Vectorama::Internal {

namespace {
    constexpr double EPSILON = EIGENVECTOR_COEFF_TOLERANCE;
    constexpr double ZERO_ROW = EIGENVECTOR_ZERO_ROW_TOLERANCE;

    // Minimum component outside span(found), matches the 0.99 cosine threshold
    const double MIN_SPAN_DISTANCE =
        std::sqrt(1.0 - EIGENVECTOR_PARALLEL_THRESHOLD * EIGENVECTOR_PARALLEL_THRESHOLD);

    // Rows of M with squared norm above ZERO_ROW
    std::vector<Vec3> NonZeroRows(const Mat33& M) {
        std::vector<Vec3> rows;
        for (int i = 0; i < 3; ++i) {
            Vec3 r = M.Row(i);
            if (r.NormSquared() > ZERO_ROW) {
                rows.push_back(r);
            }
        }
        return rows;
    }

    bool AllParallel(const std::vector<Vec3>& rows) {
        for (size_t i = 0; i < rows.size(); ++i) {
            for (size_t j = i + 1; j < rows.size(); ++j) {
                double cosine = rows[i].Normalized().Dot(rows[j].Normalized());
                if (std::abs(cosine) <= EIGENVECTOR_PARALLEL_THRESHOLD) {
                    return false;
                }
            }
        }
        return true;
    }

    // Axis least aligned with n, so axis x n is well conditioned
    Vec3 TransverseAxis(const Vec3& n) {
        return (std::abs(n[0]) < 0.9) ? Vec3::Unit(0) : Vec3::Unit(1);
    }

    std::optional<Vec3> FirstAccepted(const Mat33& M, const std::vector<Vec3>& candidates,
                                      const std::vector<Vec3>& found) {
        for (const auto& v : candidates) {
            if (IsAcceptedEigenVector(M, v, found)) {
                return v;
            }
        }
        return std::nullopt;
    }

    // Normalized cross product, skipped when the inputs are (near) parallel
    void PushCross(std::vector<Vec3>& candidates, const Vec3& a, const Vec3& b) {
        Vec3 c = Cross(a, b);
        if (c.NormSquared() > ZERO_ROW) {
            candidates.push_back(c.Normalized());
        }
    }
}

// =============================================================================
// Validation
// =============================================================================

template<int N>
bool IsIndependentOf(const Vec<N>& v, const std::vector<Vec<N>>& found) {
    for (const auto& f : found) {
        if (std::abs(v.Dot(f)) > EIGENVECTOR_PARALLEL_THRESHOLD) {
            return false;
        }
    }

    // Gram-Schmidt basis of span(found), then the part of v outside it
    std::vector<Vec<N>> basis;
    for (const auto& f : found) {
        Vec<N> u = f;
        for (const auto& b : basis) {
            u = u - b * u.Dot(b);
        }
        if (u.Norm() > MIN_SPAN_DISTANCE) {
            basis.push_back(u.Normalized());
        }
    }
    if (static_cast<int>(basis.size()) >= N) {
        return false;
    }

    Vec<N> outside = v;
    for (const auto& b : basis) {
        outside = outside - b * outside.Dot(b);
    }
    return outside.Norm() >= MIN_SPAN_DISTANCE;
}

template<int N>
bool IsAcceptedEigenVector(const Mat<N>& shifted, const Vec<N>& v,
                           const std::vector<Vec<N>>& found) {
    if (!v.IsFinite()) {
        return false;
    }
    if (std::abs(v.Norm() - 1.0) > EIGENVECTOR_UNIT_TOLERANCE) {
        return false;
    }
    if ((shifted * v).Norm() >= EIGENVECTOR_RESIDUAL_TOLERANCE) {
        return false;
    }
    return IsIndependentOf(v, found);
}

template bool IsIndependentOf<2>(const Vec2&, const std::vector<Vec2>&);
template bool IsIndependentOf<3>(const Vec3&, const std::vector<Vec3>&);
template bool IsAcceptedEigenVector<2>(const Mat22&, const Vec2&, const std::vector<Vec2>&);
template bool IsAcceptedEigenVector<3>(const Mat33&, const Vec3&, const std::vector<Vec3>&);

// =============================================================================
// 2x2 Eigenvector
// =============================================================================

std::optional<Vec2> EigenVector(const Mat22& A, double lambda, const std::vector<Vec2>& found) {
    const double a = A(0, 0), b = A(0, 1);
    const double c = A(1, 0), d = A(1, 1);
    const Mat22 M = A.Shifted(lambda);

    std::vector<Vec2> candidates;

    // First row: (a - lambda) x + b y = 0
    if (std::abs(b) > EPSILON) {
        candidates.push_back(Vec2{b, lambda - a});
    }
    // Second row: c x + (d - lambda) y = 0
    if (std::abs(c) > EPSILON) {
        candidates.push_back(Vec2{lambda - d, c});
    }

    // Diagonal shifted matrix
    if (std::abs(a - lambda) > EPSILON) {
        candidates.push_back(Vec2{0.0, 1.0});
    }
    if (std::abs(d - lambda) > EPSILON) {
        candidates.push_back(Vec2{1.0, 0.0});
    }

    // A == lambda*I, every direction is an eigenvector
    if (SingularRank(M) == 0) {
        if (found.empty()) {
            candidates.push_back(Vec2{1.0, 0.0});
        } else {
            candidates.push_back(Vec2{-found[0][1], found[0][0]});
        }
    }

    for (const auto& raw : candidates) {
        Vec2 v = raw.Normalized();
        if (IsAcceptedEigenVector(M, v, found)) {
            return v;
        }
    }
    return std::nullopt;
}

// =============================================================================
// 3x3 Strategies
// =============================================================================

std::optional<Vec3> NullVectorWholeSpace(const Mat33& shifted, const std::vector<Vec3>& found) {
    if (!NonZeroRows(shifted).empty()) {
        return std::nullopt;
    }

    std::vector<Vec3> candidates;
    if (found.empty()) {
        candidates.push_back(Vec3::Unit(0));
    } else if (found.size() == 1) {
        PushCross(candidates, TransverseAxis(found[0]), found[0]);
    } else {
        PushCross(candidates, found[0], found[1]);
    }
    return FirstAccepted(shifted, candidates, found);
}

std::optional<Vec3> NullVectorPlane(const Mat33& shifted, const std::vector<Vec3>& found) {
    std::vector<Vec3> rows = NonZeroRows(shifted);
    if (rows.empty() || !AllParallel(rows)) {
        return std::nullopt;
    }

    // Largest row carries the least relative error from an inexact lambda
    Vec3 normal = rows.front();
    for (const auto& r : rows) {
        if (r.NormSquared() > normal.NormSquared()) {
            normal = r;
        }
    }
    normal = normal.Normalized();

    std::vector<Vec3> candidates;
    for (const auto& f : found) {
        PushCross(candidates, normal, f);
    }

    // Arbitrary in-plane directions, best conditioned axis first
    PushCross(candidates, TransverseAxis(normal), normal);
    for (int axis = 0; axis < 3; ++axis) {
        PushCross(candidates, Vec3::Unit(axis), normal);
    }

    return FirstAccepted(shifted, candidates, found);
}

std::optional<Vec3> NullVectorCrossProduct(const Mat33& shifted, const std::vector<Vec3>& found) {
    std::vector<Vec3> rows = NonZeroRows(shifted);

    std::vector<Vec3> candidates;
    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t j = i + 1; j < rows.size(); ++j) {
            PushCross(candidates, rows[i], rows[j]);
        }
    }
    return FirstAccepted(shifted, candidates, found);
}

std::optional<Vec3> NullVectorElimination(const Mat33& shifted, const std::vector<Vec3>& found) {
    std::vector<Vec3> rows = NonZeroRows(shifted);
    if (rows.size() < 2) {
        return std::nullopt;
    }

    // Pick (row pair, fixed coordinate) with the best conditioned minor
    double bestDet = 0.0;
    size_t bestR = 0, bestS = 1;
    int bestK = -1;
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t s = r + 1; s < rows.size(); ++s) {
            for (int k = 0; k < 3; ++k) {
                int i = (k + 1) % 3;
                int j = (k + 2) % 3;
                double det = rows[r][i] * rows[s][j] - rows[r][j] * rows[s][i];
                if (std::abs(det) > std::abs(bestDet)) {
                    bestDet = det;
                    bestR = r;
                    bestS = s;
                    bestK = k;
                }
            }
        }
    }

    if (bestK < 0 || std::abs(bestDet) <= EPSILON) {
        return std::nullopt;
    }

    // v[k] = 1, solve r_i v_i + r_j v_j = -r_k and s_i v_i + s_j v_j = -s_k
    const Vec3& r = rows[bestR];
    const Vec3& s = rows[bestS];
    int i = (bestK + 1) % 3;
    int j = (bestK + 2) % 3;

    Vec3 v;
    v[bestK] = 1.0;
    v[i] = (-r[bestK] * s[j] + s[bestK] * r[j]) / bestDet;
    v[j] = (-r[i] * s[bestK] + s[i] * r[bestK]) / bestDet;

    return FirstAccepted(shifted, {v.Normalized()}, found);
}

const std::array<NullVectorStrategy, 4>& NullVectorStrategies() {
    static const std::array<NullVectorStrategy, 4> strategies = {
        &NullVectorWholeSpace,
        &NullVectorPlane,
        &NullVectorCrossProduct,
        &NullVectorElimination
    };
    return strategies;
}

// =============================================================================
// 3x3 Eigenvector
// =============================================================================

std::optional<Vec3> EigenVector(const Mat33& A, double lambda, const std::vector<Vec3>& found) {
    const Mat33 M = A.Shifted(lambda);
    for (NullVectorStrategy strategy : NullVectorStrategies()) {
        if (auto v = strategy(M, found)) {
            return v;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Row Analysis
// =============================================================================

int SingularRank(const Mat22& shifted) {
    for (int i = 0; i < 2; ++i) {
        for (int j = 0; j < 2; ++j) {
            if (std::abs(shifted(i, j)) > EPSILON) {
                return 1;
            }
        }
    }
    return 0;
}

int SingularRank(const Mat33& shifted) {
    std::vector<Vec3> rows = NonZeroRows(shifted);
    if (rows.empty()) {
        return 0;
    }
    return AllParallel(rows) ? 1 : 2;
}

} // namespace Vectorama::Internal
