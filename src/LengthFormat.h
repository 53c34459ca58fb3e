#pragma once

#include <optional>
#include <string>

namespace Planform {

/**
 * Imperial length labels for walls.
 * Lengths are stored in centimeters; labels are shown as feet and inches.
 */
namespace LengthFormat {

constexpr float CM_PER_INCH = 2.54f;

/**
 * Format a length as whole feet and rounded inches, e.g. 381 cm -> 12'6".
 * Inches are rounded after the feet are floored, so values just under a
 * foot boundary may print as 12 inches.
 */
std::string FormatFeetInches(float cm);

/**
 * Parse user input such as 12'6", 12' 6", 12', 12.5' or 150".
 * @param text Text typed into the inline length editor
 * @return Length in centimeters, or nullopt if the text is not recognized
 */
std::optional<float> ParseFeetInches(const std::string& text);

} // namespace LengthFormat
} // namespace Planform
