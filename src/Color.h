#pragma once

#include <string>

namespace Planform {

// ============================================================================
// Color utilities
// ============================================================================

/**
 * RGBA color representation with float components (0.0-1.0).
 * Supports hex string parsing and conversion.
 */
struct Color {
    float r, g, b, a;
    
    Color() : r(0), g(0), b(0), a(1) {}
    Color(float r, float g, float b, float a = 1.0f) 
        : r(r), g(g), b(b), a(a) {}
    
    // Parse from hex string "#RRGGBB" or "#RRGGBBAA" (black if malformed)
    static Color FromHex(const std::string& hex);
    
    // Convert to hex string
    std::string ToHex(bool includeAlpha = true) const;
    
    Color WithAlpha(float alpha) const { return Color(r, g, b, alpha); }
    
    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
};

} // namespace Planform
