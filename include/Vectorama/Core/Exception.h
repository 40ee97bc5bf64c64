#pragma once

#include <Vectorama/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for Vectorama
 *
 * Only the input layers (MatrixInput, Presets, Validate) throw. The
 * eigen engine itself degrades to "fewer invariant objects" instead.
 */

#include <stdexcept>
#include <string>

namespace Vectorama {

/**
 * @brief Base exception class for Vectorama
 */
class VECTORAMA_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class VECTORAMA_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Malformed textual input (matrix text, preset names)
 */
class VECTORAMA_API ParseException : public InvalidArgumentException {
public:
    explicit ParseException(const std::string& message)
        : InvalidArgumentException("cannot parse " + message) {}
};

} // namespace Vectorama
