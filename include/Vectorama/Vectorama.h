#pragma once

/**
 * @file Vectorama.h
 * @brief Main header file for the Vectorama library
 *
 * Vectorama computes the invariant lines and planes of 2x2 / 3x3 linear
 * maps (real eigenspaces of dimension 1 and 2) for visualization.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <Vectorama/VectoramaConfig.h>
#include <Vectorama/Core/Export.h>

// Core utilities
#include <Vectorama/Core/Exception.h>
#include <Vectorama/Core/Validate.h>

// Eigen engine
#include <Vectorama/Internal/Matrix.h>
#include <Vectorama/Internal/Polynomial.h>
#include <Vectorama/Internal/EigenVector.h>
#include <Vectorama/Invariant/Degeneracy.h>
#include <Vectorama/Invariant/InvariantSpace.h>

// Input layers
#include <Vectorama/Transform/Presets.h>
#include <Vectorama/Transform/MatrixInput.h>

namespace Vectorama {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return VECTORAMA_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = VECTORAMA_VERSION_MAJOR;
    minor = VECTORAMA_VERSION_MINOR;
    patch = VECTORAMA_VERSION_PATCH;
}

} // namespace Vectorama
