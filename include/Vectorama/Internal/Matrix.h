#pragma once

/**
 * @file Matrix.h
 * @brief Small fixed-size vector and square matrix types
 *
 * Provides:
 * - Vec<N>: stack-allocated vector (N = 2 or 3 in practice)
 * - Mat<N>: stack-allocated row-major N x N matrix
 * - Cross product for Vec3
 * - Shifted matrix (A - lambda*I), the system every eigenvector solve works on
 *
 * Used by:
 * - Polynomial.h (characteristic polynomial coefficients)
 * - EigenVector.h (null space extraction)
 * - InvariantSpace.h (eigen pairs, invariant lines and planes)
 *
 * Design principles:
 * - Value semantics, no heap allocation
 * - Zero-initialized by default
 * - Normalizing a (near) zero vector yields the zero vector, never NaN
 */

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace Vectorama::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Norm below which a vector is treated as zero when normalizing
constexpr double VECTOR_EPSILON = 1e-15;

// =============================================================================
// Fixed-Size Vector: Vec<N>
// =============================================================================

/**
 * @brief Fixed-size column vector
 * @tparam N Dimension (1..4)
 */
template<int N>
class Vec {
    static_assert(N >= 1 && N <= 4, "Vec dimension must be between 1 and 4");

public:
    /// Zero vector
    Vec() {
        std::fill(data_, data_ + N, 0.0);
    }

    /// Construct from initializer list, missing entries stay zero
    Vec(std::initializer_list<double> init) {
        std::fill(data_, data_ + N, 0.0);
        int i = 0;
        for (auto val : init) {
            if (i >= N) break;
            data_[i++] = val;
        }
    }

    double& operator[](int i) { return data_[i]; }
    const double& operator[](int i) const { return data_[i]; }

    Vec operator+(const Vec& v) const {
        Vec result;
        for (int i = 0; i < N; ++i) result.data_[i] = data_[i] + v.data_[i];
        return result;
    }

    Vec operator-(const Vec& v) const {
        Vec result;
        for (int i = 0; i < N; ++i) result.data_[i] = data_[i] - v.data_[i];
        return result;
    }

    Vec operator*(double s) const {
        Vec result;
        for (int i = 0; i < N; ++i) result.data_[i] = data_[i] * s;
        return result;
    }

    Vec operator/(double s) const {
        Vec result;
        for (int i = 0; i < N; ++i) result.data_[i] = data_[i] / s;
        return result;
    }

    double Dot(const Vec& v) const {
        double sum = 0.0;
        for (int i = 0; i < N; ++i) sum += data_[i] * v.data_[i];
        return sum;
    }

    double Norm() const {
        return std::sqrt(NormSquared());
    }

    double NormSquared() const {
        double sum = 0.0;
        for (int i = 0; i < N; ++i) sum += data_[i] * data_[i];
        return sum;
    }

    /// Unit vector in the same direction, zero vector if norm is ~0
    Vec Normalized() const {
        double n = Norm();
        if (n < VECTOR_EPSILON) return Vec();
        return *this / n;
    }

    /// True if every component is finite
    bool IsFinite() const {
        for (int i = 0; i < N; ++i) {
            if (!std::isfinite(data_[i])) return false;
        }
        return true;
    }

    /// Unit vector along specified axis
    static Vec Unit(int axis) {
        Vec result;
        if (axis >= 0 && axis < N) result.data_[axis] = 1.0;
        return result;
    }

private:
    double data_[N];
};

template<int N>
inline Vec<N> operator*(double s, const Vec<N>& v) {
    return v * s;
}

using Vec2 = Vec<2>;
using Vec3 = Vec<3>;

/// Cross product (only for Vec3)
inline Vec3 Cross(const Vec3& a, const Vec3& b) {
    return Vec3{
        a[1] * b[2] - a[2] * b[1],
        a[2] * b[0] - a[0] * b[2],
        a[0] * b[1] - a[1] * b[0]
    };
}

/// Embed a 2D vector into the z = 0 plane
inline Vec3 Lift(const Vec2& v) {
    return Vec3{v[0], v[1], 0.0};
}

// =============================================================================
// Fixed-Size Square Matrix: Mat<N>
// =============================================================================

/**
 * @brief Fixed-size square matrix, row-major storage
 * @tparam N Dimension (2 or 3)
 *
 * Element (i, j) is row i, column j, matching the reading order of a
 * matrix typed as rows: {a00, a01, a10, a11} for 2x2.
 */
template<int N>
class Mat {
    static_assert(N == 2 || N == 3, "Mat dimension must be 2 or 3");

public:
    /// Zero matrix
    Mat() {
        std::fill(data_, data_ + N * N, 0.0);
    }

    /// Construct from row-major initializer list
    Mat(std::initializer_list<double> init) {
        std::fill(data_, data_ + N * N, 0.0);
        int i = 0;
        for (auto val : init) {
            if (i >= N * N) break;
            data_[i++] = val;
        }
    }

    double& operator()(int row, int col) { return data_[row * N + col]; }
    const double& operator()(int row, int col) const { return data_[row * N + col]; }

    Vec<N> Row(int i) const {
        Vec<N> result;
        for (int j = 0; j < N; ++j) result[j] = data_[i * N + j];
        return result;
    }

    Vec<N> operator*(const Vec<N>& v) const {
        Vec<N> result;
        for (int i = 0; i < N; ++i) {
            double sum = 0.0;
            for (int j = 0; j < N; ++j) sum += data_[i * N + j] * v[j];
            result[i] = sum;
        }
        return result;
    }

    Mat operator*(double s) const {
        Mat result;
        for (int i = 0; i < N * N; ++i) result.data_[i] = data_[i] * s;
        return result;
    }

    /// A - lambda * I
    Mat Shifted(double lambda) const {
        Mat result = *this;
        for (int i = 0; i < N; ++i) result(i, i) -= lambda;
        return result;
    }

    double Trace() const {
        double sum = 0.0;
        for (int i = 0; i < N; ++i) sum += data_[i * N + i];
        return sum;
    }

    double Determinant() const;

    bool IsFinite() const {
        for (int i = 0; i < N * N; ++i) {
            if (!std::isfinite(data_[i])) return false;
        }
        return true;
    }

    static Mat Identity() {
        Mat result;
        for (int i = 0; i < N; ++i) result(i, i) = 1.0;
        return result;
    }

    static Mat Diagonal(const Vec<N>& diag) {
        Mat result;
        for (int i = 0; i < N; ++i) result(i, i) = diag[i];
        return result;
    }

private:
    double data_[N * N];
};

template<>
inline double Mat<2>::Determinant() const {
    return data_[0] * data_[3] - data_[1] * data_[2];
}

template<>
inline double Mat<3>::Determinant() const {
    const double a = data_[0], b = data_[1], c = data_[2];
    const double d = data_[3], e = data_[4], f = data_[5];
    const double g = data_[6], h = data_[7], i = data_[8];
    return a * (e * i - f * h) - b * (d * i - f * g) + c * (d * h - e * g);
}

using Mat22 = Mat<2>;
using Mat33 = Mat<3>;

/// ||(A - lambda*I) v||
template<int N>
inline double Residual(const Mat<N>& A, double lambda, const Vec<N>& v) {
    return (A.Shifted(lambda) * v).Norm();
}

} // namespace Vectorama::Internal
