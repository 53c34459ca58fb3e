#include "Color.h"
#include <cstdint>
#include <cstdio>
#include <cctype>

namespace Planform {

Color Color::FromHex(const std::string& hex) {
    if (hex.empty() || hex[0] != '#') {
        return Color(0, 0, 0, 1);
    }
    
    std::string str = hex.substr(1);
    for (char c : str) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Color(0, 0, 0, 1);
        }
    }
    
    unsigned int val = 0;
    if (sscanf(str.c_str(), "%x", &val) != 1) {
        return Color(0, 0, 0, 1);
    }
    
    if (str.length() == 6) {
        // #RRGGBB
        return Color(
            ((val >> 16) & 0xFF) / 255.0f,
            ((val >> 8) & 0xFF) / 255.0f,
            (val & 0xFF) / 255.0f,
            1.0f
        );
    } else if (str.length() == 8) {
        // #RRGGBBAA
        return Color(
            ((val >> 24) & 0xFF) / 255.0f,
            ((val >> 16) & 0xFF) / 255.0f,
            ((val >> 8) & 0xFF) / 255.0f,
            (val & 0xFF) / 255.0f
        );
    }
    
    return Color(0, 0, 0, 1);
}

std::string Color::ToHex(bool includeAlpha) const {
    auto channel = [](float v) {
        return static_cast<int>(v * 255.0f + 0.5f);
    };
    
    char buf[16];
    if (includeAlpha) {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x",
            channel(r), channel(g), channel(b), channel(a));
    } else {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x",
            channel(r), channel(g), channel(b));
    }
    return buf;
}

} // namespace Planform
