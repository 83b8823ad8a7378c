/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/DrawContext.hpp"
#include <algorithm>
#include <cctype>

namespace CloudDefenders {

namespace {
int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}
}

Color Color::fromHex(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6) {
        return Color(136, 136, 136);
    }

    uint8_t channels[3];
    for (size_t i = 0; i < 3; ++i) {
        int hi = hexDigit(hex[i * 2]);
        int lo = hexDigit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return Color(136, 136, 136);
        }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color(channels[0], channels[1], channels[2]);
}

Color Color::withAlpha(float alpha) const {
    float clamped = std::clamp(alpha, 0.0f, 1.0f);
    return Color(r, g, b, static_cast<uint8_t>(clamped * 255.0f));
}

} // namespace CloudDefenders
