/**
 * @file MatrixInput.cpp
 * @brief Text parsing and formatting of small matrices
 */

#include <Vectorama/Transform/MatrixInput.h>
#include <Vectorama/Core/Exception.h>
#include <Vectorama/Core/Validate.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace Vectorama::Transform {

namespace {
    bool IsRowSeparator(char ch) {
        return ch == ';' || ch == '\n';
    }

    bool IsEntrySeparator(char ch) {
        return ch == ' ' || ch == '\t' || ch == '\r' || ch == ',';
    }

    double ParseEntry(const std::string& token) {
        char* end = nullptr;
        double value = std::strtod(token.c_str(), &end);
        if (end == token.c_str() || *end != '\0') {
            throw ParseException("matrix entry '" + token + "'");
        }
        // Overflow comes back as +-HUGE_VAL; underflow is a finite
        // (possibly denormal or zero) value and is kept
        if (!std::isfinite(value)) {
            throw ParseException("matrix entry '" + token + "': value must be finite");
        }
        return value;
    }

    template<int N>
    Internal::Mat<N> ParseSquare(const std::string& text) {
        std::vector<std::vector<double>> rows = ParseRows(text);

        // Flat row-major form
        if (rows.size() == 1 && rows[0].size() == static_cast<size_t>(N * N)) {
            std::vector<double> flat = rows[0];
            rows.assign(N, std::vector<double>());
            for (int i = 0; i < N * N; ++i) {
                rows[i / N].push_back(flat[i]);
            }
        }

        if (rows.size() != static_cast<size_t>(N)) {
            throw ParseException("matrix: expected " + std::to_string(N) + " rows, got " +
                                 std::to_string(rows.size()));
        }

        Internal::Mat<N> A;
        for (int i = 0; i < N; ++i) {
            if (rows[i].size() != static_cast<size_t>(N)) {
                throw ParseException("matrix: row " + std::to_string(i) + " has " +
                                     std::to_string(rows[i].size()) + " entries, expected " +
                                     std::to_string(N));
            }
            for (int j = 0; j < N; ++j) {
                A(i, j) = rows[i][j];
            }
        }

        Validate::RequireFinite(A, "ParseMatrix");
        return A;
    }

    template<int N>
    std::string Format(const Internal::Mat<N>& A) {
        std::string out;
        char buf[32];
        for (int i = 0; i < N; ++i) {
            if (i > 0) out += "; ";
            for (int j = 0; j < N; ++j) {
                if (j > 0) out += " ";
                std::snprintf(buf, sizeof(buf), "%.6g", A(i, j));
                out += buf;
            }
        }
        return out;
    }
}

std::vector<std::vector<double>> ParseRows(const std::string& text) {
    std::vector<std::vector<double>> rows;
    std::vector<double> row;
    std::string token;

    auto flushToken = [&]() {
        if (!token.empty()) {
            row.push_back(ParseEntry(token));
            token.clear();
        }
    };
    auto flushRow = [&]() {
        flushToken();
        if (!row.empty()) {
            rows.push_back(row);
            row.clear();
        }
    };

    for (char ch : text) {
        if (IsRowSeparator(ch)) {
            flushRow();
        } else if (IsEntrySeparator(ch)) {
            flushToken();
        } else {
            token += ch;
        }
    }
    flushRow();

    return rows;
}

Mat22 ParseMatrix2x2(const std::string& text) {
    return ParseSquare<2>(text);
}

Mat33 ParseMatrix3x3(const std::string& text) {
    return ParseSquare<3>(text);
}

int EntryCount(const std::string& text) {
    int count = 0;
    for (const auto& row : ParseRows(text)) {
        count += static_cast<int>(row.size());
    }
    return count;
}

int TokenCount(const std::string& text) {
    int count = 0;
    bool inToken = false;
    for (char ch : text) {
        bool separator = IsRowSeparator(ch) || IsEntrySeparator(ch);
        if (!separator && !inToken) {
            ++count;
        }
        inToken = !separator;
    }
    return count;
}

std::string FormatMatrix(const Mat22& A) {
    return Format(A);
}

std::string FormatMatrix(const Mat33& A) {
    return Format(A);
}

} // namespace Vectorama::Transform
