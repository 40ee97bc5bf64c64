#pragma once

/**
 * @file Validate.h
 * @brief Input validation utilities for Vectorama
 *
 * The eigen engine assumes finite input and never throws; callers that
 * take matrices from outside (text input, UI fields) validate here first.
 *
 * RequireFinite() throws InvalidArgumentException naming the first
 * non-finite entry; Mat::IsFinite() is the non-throwing check.
 */

#include <Vectorama/Core/Exception.h>
#include <Vectorama/Internal/Matrix.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Vectorama::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Matrix Validation
// =============================================================================

/**
 * @brief Require a matrix with finite entries
 * @throws InvalidArgumentException naming the first offending entry
 */
template<int N>
inline void RequireFinite(const Internal::Mat<N>& A, const char* funcName) {
    for (int i = 0; i < N; ++i) {
        for (int j = 0; j < N; ++j) {
            if (!std::isfinite(A(i, j))) {
                throw InvalidArgumentException(std::string(funcName) + ": entry (" +
                                               Detail::FormatValue(i) + ", " +
                                               Detail::FormatValue(j) + ") must be finite, got " +
                                               Detail::FormatValue(A(i, j)));
            }
        }
    }
}

} // namespace Vectorama::Validate
