#pragma once

/**
 * @file MatrixInput.h
 * @brief Text input of 2x2 / 3x3 matrices
 *
 * Accepted forms (2x2 shown):
 *   "1 0.5; 0 1"       rows separated by ';'
 *   "1, 0.5\n0, 1"     rows separated by newlines, entries by ','
 *   "1 0.5 0 1"        single row holding all N*N entries, row-major
 *
 * Every entry must parse completely as a finite number. Violations throw
 * ParseException (a subclass of InvalidArgumentException) so the eigen
 * engine only ever sees validated matrices.
 */

#include <Vectorama/Core/Export.h>
#include <Vectorama/Internal/Matrix.h>

#include <string>
#include <vector>

namespace Vectorama::Transform {

using Internal::Mat22;
using Internal::Mat33;

/**
 * @brief Split text into rows of numbers without checking the shape
 * @throws ParseException for an unparsable or non-finite token
 */
VECTORAMA_API std::vector<std::vector<double>> ParseRows(const std::string& text);

/**
 * @brief Parse a 2x2 matrix
 * @throws ParseException on wrong shape, bad token or non-finite entry
 */
VECTORAMA_API Mat22 ParseMatrix2x2(const std::string& text);

/**
 * @brief Parse a 3x3 matrix
 * @throws ParseException on wrong shape, bad token or non-finite entry
 */
VECTORAMA_API Mat33 ParseMatrix3x3(const std::string& text);

/**
 * @brief Number of entries in text (4 -> 2x2, 9 -> 3x3), for callers that
 *        accept either dimension
 * @throws ParseException for an unparsable token
 */
VECTORAMA_API int EntryCount(const std::string& text);

/**
 * @brief Number of whitespace / ',' / ';' separated tokens, without parsing
 *
 * A single token is a candidate preset name; anything longer is matrix
 * text, even when it starts with "nan" or "inf".
 */
VECTORAMA_API int TokenCount(const std::string& text);

/**
 * @brief Render as "a00 a01; a10 a11" using %.6g
 */
VECTORAMA_API std::string FormatMatrix(const Mat22& A);
VECTORAMA_API std::string FormatMatrix(const Mat33& A);

} // namespace Vectorama::Transform
