/**
 * @file test_internal_matrix.cpp
 * @brief Unit tests for Internal/Matrix module
 */

#include <Vectorama/Internal/Matrix.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace Vectorama::Internal;

// =============================================================================
// Vec<N> Tests
// =============================================================================

class VecTest : public ::testing::Test {
protected:
    static constexpr double EPS = 1e-12;
};

TEST_F(VecTest, DefaultConstruction) {
    Vec2 v2;
    EXPECT_DOUBLE_EQ(v2[0], 0.0);
    EXPECT_DOUBLE_EQ(v2[1], 0.0);

    Vec3 v3;
    EXPECT_DOUBLE_EQ(v3[0], 0.0);
    EXPECT_DOUBLE_EQ(v3[1], 0.0);
    EXPECT_DOUBLE_EQ(v3[2], 0.0);
}

TEST_F(VecTest, InitializerListPartial) {
    Vec3 v{1.0, 2.0};
    EXPECT_DOUBLE_EQ(v[0], 1.0);
    EXPECT_DOUBLE_EQ(v[1], 2.0);
    EXPECT_DOUBLE_EQ(v[2], 0.0);
}

TEST_F(VecTest, Arithmetic) {
    Vec3 a{1.0, 2.0, 3.0};
    Vec3 b{4.0, 5.0, 6.0};

    Vec3 sum = a + b;
    EXPECT_DOUBLE_EQ(sum[2], 9.0);

    Vec3 diff = b - a;
    EXPECT_DOUBLE_EQ(diff[0], 3.0);

    Vec3 scaled = 2.0 * a;
    EXPECT_DOUBLE_EQ(scaled[1], 4.0);

    EXPECT_DOUBLE_EQ(a.Dot(b), 32.0);
}

TEST_F(VecTest, NormAndNormalize) {
    Vec2 v{3.0, 4.0};
    EXPECT_DOUBLE_EQ(v.Norm(), 5.0);
    EXPECT_DOUBLE_EQ(v.NormSquared(), 25.0);

    Vec2 n = v.Normalized();
    EXPECT_NEAR(n.Norm(), 1.0, EPS);
    EXPECT_NEAR(n[0], 0.6, EPS);
    EXPECT_NEAR(n[1], 0.8, EPS);
}

TEST_F(VecTest, NormalizeZeroGivesZero) {
    Vec3 zero;
    Vec3 n = zero.Normalized();
    EXPECT_TRUE(n.IsFinite());
    EXPECT_DOUBLE_EQ(n.Norm(), 0.0);
}

TEST_F(VecTest, IsFinite) {
    Vec3 v{1.0, std::numeric_limits<double>::quiet_NaN(), 0.0};
    EXPECT_FALSE(v.IsFinite());
    EXPECT_TRUE(Vec3::Unit(2).IsFinite());
}

TEST_F(VecTest, UnitAxes) {
    Vec3 z = Vec3::Unit(2);
    EXPECT_DOUBLE_EQ(z[0], 0.0);
    EXPECT_DOUBLE_EQ(z[2], 1.0);

    // Out of range axis gives the zero vector
    EXPECT_DOUBLE_EQ(Vec3::Unit(5).Norm(), 0.0);
}

TEST_F(VecTest, CrossProduct) {
    Vec3 z = Cross(Vec3::Unit(0), Vec3::Unit(1));
    EXPECT_NEAR(z[0], 0.0, EPS);
    EXPECT_NEAR(z[1], 0.0, EPS);
    EXPECT_NEAR(z[2], 1.0, EPS);

    Vec3 a{1.0, 2.0, 3.0};
    Vec3 c = Cross(a, Vec3{-2.0, 0.5, 4.0});
    EXPECT_NEAR(c.Dot(a), 0.0, EPS);
}

TEST_F(VecTest, LiftToPlane) {
    Vec3 v = Lift(Vec2{0.6, -0.8});
    EXPECT_DOUBLE_EQ(v[0], 0.6);
    EXPECT_DOUBLE_EQ(v[1], -0.8);
    EXPECT_DOUBLE_EQ(v[2], 0.0);
}

// =============================================================================
// Mat<N> Tests
// =============================================================================

class MatTest : public ::testing::Test {
protected:
    static constexpr double EPS = 1e-12;
};

TEST_F(MatTest, RowMajorConstruction) {
    Mat22 A{1.0, 2.0,
            3.0, 4.0};
    EXPECT_DOUBLE_EQ(A(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(A(1, 0), 3.0);

    Vec2 r = A.Row(1);
    EXPECT_DOUBLE_EQ(r[0], 3.0);
    EXPECT_DOUBLE_EQ(r[1], 4.0);
}

TEST_F(MatTest, IdentityAndDiagonal) {
    Mat33 I = Mat33::Identity();
    EXPECT_DOUBLE_EQ(I(1, 1), 1.0);
    EXPECT_DOUBLE_EQ(I(0, 2), 0.0);

    Mat33 D = Mat33::Diagonal(Vec3{1.0, 2.0, 3.0});
    EXPECT_DOUBLE_EQ(D(2, 2), 3.0);
    EXPECT_DOUBLE_EQ(D.Trace(), 6.0);
}

TEST_F(MatTest, MatrixVectorProduct) {
    Mat33 A{1.0, 2.0, 3.0,
            0.0, 1.0, 4.0,
            5.0, 6.0, 0.0};
    Vec3 r = A * Vec3{1.0, 1.0, 1.0};
    EXPECT_DOUBLE_EQ(r[0], 6.0);
    EXPECT_DOUBLE_EQ(r[1], 5.0);
    EXPECT_DOUBLE_EQ(r[2], 11.0);
}

TEST_F(MatTest, Determinant) {
    Mat22 A{1.0, 2.0,
            3.0, 4.0};
    EXPECT_NEAR(A.Determinant(), -2.0, EPS);

    Mat33 B{1.0, 2.0, 3.0,
            0.0, 1.0, 4.0,
            5.0, 6.0, 0.0};
    EXPECT_NEAR(B.Determinant(), 1.0, EPS);
}

TEST_F(MatTest, Shifted) {
    Mat22 A{2.0, 1.0,
            0.0, 3.0};
    Mat22 M = A.Shifted(3.0);
    EXPECT_DOUBLE_EQ(M(0, 0), -1.0);
    EXPECT_DOUBLE_EQ(M(0, 1), 1.0);
    EXPECT_DOUBLE_EQ(M(1, 1), 0.0);
    EXPECT_NEAR(M.Determinant(), 0.0, EPS);
}

TEST_F(MatTest, Scale) {
    Mat22 A = Mat22::Identity() * 2.0;
    EXPECT_DOUBLE_EQ(A(1, 1), 2.0);
    EXPECT_DOUBLE_EQ(A(0, 1), 0.0);

    Mat33 B = Mat33{1.0, -7.0, 0.0,
                    0.0, 2.0, 0.0,
                    0.0, 0.0, 3.0} * -0.5;
    EXPECT_DOUBLE_EQ(B(0, 1), 3.5);
    EXPECT_DOUBLE_EQ(B.Trace(), -3.0);
}

TEST_F(MatTest, IsFinite) {
    Mat22 A{1.0, std::numeric_limits<double>::infinity(),
            0.0, 1.0};
    EXPECT_FALSE(A.IsFinite());
    EXPECT_TRUE(Mat22::Identity().IsFinite());
}

TEST_F(MatTest, Residual) {
    Mat22 A{2.0, 1.0,
            0.0, 3.0};
    Vec2 v = Vec2{1.0, 1.0}.Normalized();
    EXPECT_NEAR(Residual(A, 3.0, v), 0.0, EPS);
    EXPECT_GT(Residual(A, 2.0, v), 0.5);
}
