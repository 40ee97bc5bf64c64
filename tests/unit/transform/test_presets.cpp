/**
 * @file test_presets.cpp
 * @brief Unit tests for Transform/Presets.h
 */

#include <Vectorama/Transform/Presets.h>
#include <Vectorama/Core/Exception.h>
#include <gtest/gtest.h>

#include <cmath>

using namespace Vectorama;
using namespace Vectorama::Transform;

class PresetsTest : public ::testing::Test {
protected:
    static constexpr double EPS = 1e-12;
};

TEST_F(PresetsTest, Identity) {
    Mat22 I = Preset2x2(PresetKind::Identity);
    EXPECT_DOUBLE_EQ(I(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(I(0, 1), 0.0);
    EXPECT_DOUBLE_EQ(I(1, 1), 1.0);
}

TEST_F(PresetsTest, Rotation2x2) {
    Mat22 R = Preset2x2(PresetKind::Rotation);
    double h = std::sqrt(0.5);
    EXPECT_NEAR(R(0, 0), h, EPS);
    EXPECT_NEAR(R(0, 1), -h, EPS);
    EXPECT_NEAR(R(1, 0), h, EPS);
    EXPECT_NEAR(R(1, 1), h, EPS);
    EXPECT_NEAR(R.Determinant(), 1.0, EPS);
}

TEST_F(PresetsTest, ScaleShearReflection2x2) {
    Mat22 S = Preset2x2(PresetKind::Scale);
    EXPECT_DOUBLE_EQ(S(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(S(1, 1), 2.0);
    EXPECT_DOUBLE_EQ(S(0, 1), 0.0);

    Mat22 H = Preset2x2(PresetKind::Shear);
    EXPECT_DOUBLE_EQ(H(0, 1), 0.5);
    EXPECT_DOUBLE_EQ(H(1, 0), 0.0);

    Mat22 F = Preset2x2(PresetKind::Reflection);
    EXPECT_DOUBLE_EQ(F(0, 0), -1.0);
    EXPECT_DOUBLE_EQ(F(1, 1), 1.0);
}

TEST_F(PresetsTest, ThreeByThreeEmbedsPlanarPreset) {
    for (PresetKind kind : {PresetKind::Rotation, PresetKind::Shear, PresetKind::Reflection}) {
        Mat22 m = Preset2x2(kind);
        Mat33 M = Preset3x3(kind);
        for (int i = 0; i < 2; ++i) {
            for (int j = 0; j < 2; ++j) {
                EXPECT_DOUBLE_EQ(M(i, j), m(i, j)) << PresetName(kind);
            }
            EXPECT_DOUBLE_EQ(M(i, 2), 0.0);
            EXPECT_DOUBLE_EQ(M(2, i), 0.0);
        }
        EXPECT_DOUBLE_EQ(M(2, 2), 1.0);
    }
}

TEST_F(PresetsTest, ThreeByThreeScaleIsUniform) {
    Mat33 S = Preset3x3(PresetKind::Scale);
    EXPECT_DOUBLE_EQ(S(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(S(1, 1), 2.0);
    EXPECT_DOUBLE_EQ(S(2, 2), 2.0);
}

TEST_F(PresetsTest, NamesRoundTrip) {
    ASSERT_EQ(AllPresets().size(), 5u);
    for (PresetKind kind : AllPresets()) {
        EXPECT_EQ(ParsePresetKind(PresetName(kind)), kind);
    }
}

TEST_F(PresetsTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(ParsePresetKind("Rotation"), PresetKind::Rotation);
    EXPECT_EQ(ParsePresetKind("SHEAR"), PresetKind::Shear);
}

TEST_F(PresetsTest, UnknownNameThrows) {
    EXPECT_THROW(ParsePresetKind("spin"), ParseException);
    EXPECT_THROW(ParsePresetKind(""), InvalidArgumentException);
}
