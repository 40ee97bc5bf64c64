/**
 * @file Presets.cpp
 * @brief Named transformation presets
 */

#include <Vectorama/Transform/Presets.h>
#include <Vectorama/Core/Exception.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Vectorama::Transform {

Mat22 Preset2x2(PresetKind kind) {
    switch (kind) {
        case PresetKind::Rotation: {
            double c = std::cos(PRESET_ROTATION_ANGLE);
            double s = std::sin(PRESET_ROTATION_ANGLE);
            return Mat22{c, -s,
                         s,  c};
        }
        case PresetKind::Scale:
            return Mat22::Identity() * PRESET_SCALE_FACTOR;
        case PresetKind::Shear:
            return Mat22{1.0, PRESET_SHEAR_FACTOR,
                         0.0, 1.0};
        case PresetKind::Reflection:
            return Mat22{-1.0, 0.0,
                          0.0, 1.0};
        case PresetKind::Identity:
        default:
            return Mat22::Identity();
    }
}

Mat33 Preset3x3(PresetKind kind) {
    if (kind == PresetKind::Scale) {
        return Mat33::Identity() * PRESET_SCALE_FACTOR;
    }

    Mat22 m = Preset2x2(kind);
    Mat33 result = Mat33::Identity();
    for (int i = 0; i < 2; ++i) {
        for (int j = 0; j < 2; ++j) {
            result(i, j) = m(i, j);
        }
    }
    return result;
}

const char* PresetName(PresetKind kind) {
    switch (kind) {
        case PresetKind::Identity:   return "identity";
        case PresetKind::Rotation:   return "rotation";
        case PresetKind::Scale:      return "scale";
        case PresetKind::Shear:      return "shear";
        case PresetKind::Reflection: return "reflection";
        default:                     return "unknown";
    }
}

PresetKind ParsePresetKind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    for (PresetKind kind : AllPresets()) {
        if (lower == PresetName(kind)) {
            return kind;
        }
    }
    throw ParseException("preset name '" + name + "'");
}

const std::vector<PresetKind>& AllPresets() {
    static const std::vector<PresetKind> presets = {
        PresetKind::Identity,
        PresetKind::Rotation,
        PresetKind::Scale,
        PresetKind::Shear,
        PresetKind::Reflection
    };
    return presets;
}

} // namespace Vectorama::Transform
