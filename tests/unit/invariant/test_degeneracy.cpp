/**
 * @file test_degeneracy.cpp
 * @brief Unit tests for Invariant/Degeneracy.h
 */

#include <gtest/gtest.h>
#include <Vectorama/Invariant/Degeneracy.h>

using namespace Vectorama::Invariant;
using Vectorama::Internal::Vec2;
using Vectorama::Internal::Vec3;

// =============================================================================
// Whole Space Detection
// =============================================================================

class WholeSpaceTest : public ::testing::Test {};

TEST_F(WholeSpaceTest, IdentityAndScalarMultiples) {
    EXPECT_TRUE(IsWholeSpaceInvariant(Mat22::Identity()));
    EXPECT_TRUE(IsWholeSpaceInvariant(Mat33::Identity()));
    EXPECT_TRUE(IsWholeSpaceInvariant(Mat22::Identity() * 2.0));
    EXPECT_TRUE(IsWholeSpaceInvariant(Mat33::Identity() * -0.5));
    EXPECT_TRUE(IsWholeSpaceInvariant(Mat33()));
}

TEST_F(WholeSpaceTest, WithinTolerance) {
    Mat22 A{1.0 + 1e-7, 1e-8,
            -1e-8, 1.0};
    EXPECT_TRUE(IsWholeSpaceInvariant(A));
}

TEST_F(WholeSpaceTest, OffDiagonalBreaksIt) {
    Mat22 shear{1.0, 0.5,
                0.0, 1.0};
    EXPECT_FALSE(IsWholeSpaceInvariant(shear));

    Mat33 A = Mat33::Identity();
    A(2, 0) = 1e-3;
    EXPECT_FALSE(IsWholeSpaceInvariant(A));
}

TEST_F(WholeSpaceTest, UnequalDiagonalBreaksIt) {
    EXPECT_FALSE(IsWholeSpaceInvariant(Mat33::Diagonal(Vec3{2.0, 2.0, 3.0})));
    EXPECT_FALSE(IsWholeSpaceInvariant(Mat22{-1.0, 0.0, 0.0, 1.0}));
}

// =============================================================================
// Grouping
// =============================================================================

class GroupingTest : public ::testing::Test {};

TEST_F(GroupingTest, GroupsKeepFirstSeenOrder) {
    std::vector<EigenPair3> pairs = {
        EigenPair3(3.0, Vec3::Unit(2)),
        EigenPair3(2.0, Vec3::Unit(0)),
        EigenPair3(2.0 + 1e-8, Vec3::Unit(1))
    };

    auto groups = GroupByEigenvalue(pairs);
    ASSERT_EQ(groups.size(), 2u);

    EXPECT_DOUBLE_EQ(groups[0].eigenvalue, 3.0);
    EXPECT_EQ(groups[0].Dimension(), 1);

    EXPECT_DOUBLE_EQ(groups[1].eigenvalue, 2.0);
    EXPECT_EQ(groups[1].Dimension(), 2);
    EXPECT_EQ(groups[1].algebraicMultiplicity, 2);
    EXPECT_FALSE(groups[1].IsDefective());
}

TEST_F(GroupingTest, DistantEigenvaluesStaySeparate) {
    std::vector<EigenPair2> pairs = {
        EigenPair2(1.0, Vec2::Unit(0)),
        EigenPair2(1.0 + 1e-4, Vec2::Unit(1))
    };
    EXPECT_EQ(GroupByEigenvalue(pairs).size(), 2u);
    EXPECT_EQ(GroupByEigenvalue(pairs, 1e-3).size(), 1u);
}

TEST_F(GroupingTest, EmptyInput) {
    EXPECT_TRUE(GroupByEigenvalue(std::vector<EigenPair3>{}).empty());
}

TEST_F(GroupingTest, FindGroup) {
    std::vector<EigenGroup2> groups(2);
    groups[0].eigenvalue = -1.0;
    groups[1].eigenvalue = 4.0;

    EXPECT_EQ(FindGroup(groups, 4.0 + 1e-9), 1);
    EXPECT_EQ(FindGroup(groups, -1.0), 0);
    EXPECT_EQ(FindGroup(groups, 0.0), -1);
}

TEST_F(GroupingTest, DefectiveGroup) {
    EigenGroup3 group;
    group.eigenvalue = 2.0;
    group.algebraicMultiplicity = 2;
    group.eigenvectors.push_back(Vec3::Unit(0));
    EXPECT_TRUE(group.IsDefective());
}

// =============================================================================
// Eigenspace Nullity
// =============================================================================

class NullityTest : public ::testing::Test {};

TEST_F(NullityTest, TwoByTwo) {
    Mat22 shear{1.0, 0.5,
                0.0, 1.0};
    EXPECT_EQ(EigenspaceNullity(shear, 1.0), 1);
    EXPECT_EQ(EigenspaceNullity(Mat22::Identity(), 1.0), 2);
}

TEST_F(NullityTest, ThreeByThree) {
    Mat33 D = Mat33::Diagonal(Vec3{2.0, 2.0, 3.0});
    EXPECT_EQ(EigenspaceNullity(D, 2.0), 2);
    EXPECT_EQ(EigenspaceNullity(D, 3.0), 1);

    Mat33 jordan{2.0, 1.0, 0.0,
                 0.0, 2.0, 0.0,
                 0.0, 0.0, 3.0};
    EXPECT_EQ(EigenspaceNullity(jordan, 2.0), 1);

    EXPECT_EQ(EigenspaceNullity(Mat33::Identity(), 1.0), 3);
}
