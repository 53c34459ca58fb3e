#include "LengthFormat.h"
#include <cmath>
#include <regex>
#include <stdexcept>

namespace Planform {
namespace LengthFormat {

std::string FormatFeetInches(float cm) {
    const float totalInches = cm / CM_PER_INCH;
    const int feet = static_cast<int>(std::floor(totalInches / 12.0f));
    const int inches = static_cast<int>(
        std::round(std::fmod(totalInches, 12.0f)));
    return std::to_string(feet) + "'" + std::to_string(inches) + "\"";
}

std::optional<float> ParseFeetInches(const std::string& text) {
    static const std::regex feetInches(R"(^(\d+)'\s*(\d+)?"?$)");
    static const std::regex decimalFeet(R"(^(\d+(?:\.\d+)?)')");
    static const std::regex inchesOnly(R"re(^(\d+(?:\.\d+)?)"$)re");

    std::smatch match;
    try {
        if (std::regex_match(text, match, feetInches)) {
            const int feet = std::stoi(match[1].str());
            const int inches = match[2].matched ? std::stoi(match[2].str()) : 0;
            return (feet * 12.0f + inches) * CM_PER_INCH;
        }

        // Prefix match: trailing text after the foot mark is ignored
        if (std::regex_search(text, match, decimalFeet)) {
            return std::stof(match[1].str()) * 12.0f * CM_PER_INCH;
        }

        if (std::regex_match(text, match, inchesOnly)) {
            return std::stof(match[1].str()) * CM_PER_INCH;
        }
    } catch (const std::out_of_range&) {
        // Digits too long to represent
        return std::nullopt;
    }

    return std::nullopt;
}

} // namespace LengthFormat
} // namespace Planform
