#pragma once

/**
 * @file Presets.h
 * @brief Named transformation presets
 *
 * The standard set offered by the visualizer's preset buttons:
 *
 *   Identity    I
 *   Rotation    45 degrees counter-clockwise (about z in 3D)
 *   Scale       uniform scale by 2
 *   Shear       x += 0.5 * y
 *   Reflection  across the y axis (x -> -x)
 */

#include <Vectorama/Core/Export.h>
#include <Vectorama/Internal/Matrix.h>

#include <string>
#include <vector>

namespace Vectorama::Transform {

using Internal::Mat22;
using Internal::Mat33;

/// Rotation angle of the Rotation preset (radians)
constexpr double PRESET_ROTATION_ANGLE = 3.14159265358979323846 / 4.0;

/// Factor of the Scale preset
constexpr double PRESET_SCALE_FACTOR = 2.0;

/// Off-diagonal entry of the Shear preset
constexpr double PRESET_SHEAR_FACTOR = 0.5;

enum class PresetKind {
    Identity,
    Rotation,
    Scale,
    Shear,
    Reflection
};

/**
 * @brief 2x2 matrix of a preset
 */
VECTORAMA_API Mat22 Preset2x2(PresetKind kind);

/**
 * @brief 3x3 matrix of a preset (2D preset embedded with a33 = 1, except
 *        Scale which scales all three axes)
 */
VECTORAMA_API Mat33 Preset3x3(PresetKind kind);

/**
 * @brief Lower-case name, e.g. "rotation"
 */
VECTORAMA_API const char* PresetName(PresetKind kind);

/**
 * @brief Parse a preset name (case-insensitive)
 * @throws ParseException for an unknown name
 */
VECTORAMA_API PresetKind ParsePresetKind(const std::string& name);

/**
 * @brief All presets in button order
 */
VECTORAMA_API const std::vector<PresetKind>& AllPresets();

} // namespace Vectorama::Transform
