/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DRAW_CONTEXT_HPP
#define DRAW_CONTEXT_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace CloudDefenders {

struct Color {
    uint8_t r{255};
    uint8_t g{255};
    uint8_t b{255};
    uint8_t a{255};

    constexpr Color() = default;
    constexpr Color(uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha = 255)
        : r(red), g(green), b(blue), a(alpha) {}

    /**
     * @brief Parse a "#RRGGBB" string. Malformed input yields opaque grey.
     */
    static Color fromHex(std::string_view hex);

    Color withAlpha(float alpha) const;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
};

enum class TextAlign : uint8_t {
    Left,
    Center,
    Right
};

/**
 * @brief Drawing capability consumed by entity and session rendering.
 *
 * Implementations own the actual render target. The simulation never
 * touches a renderer directly, which keeps it testable headless.
 */
class DrawContext {
public:
    virtual ~DrawContext() = default;

    virtual void fillRect(float x, float y, float w, float h, const Color& color) = 0;
    virtual void strokeRect(float x, float y, float w, float h, const Color& color,
                            float lineWidth = 1.0f) = 0;
    virtual void drawLine(float x1, float y1, float x2, float y2, const Color& color,
                          float lineWidth = 1.0f) = 0;
    virtual void fillCircle(float cx, float cy, float radius, const Color& color) = 0;
    virtual void strokeCircle(float cx, float cy, float radius, const Color& color,
                              float lineWidth = 1.0f) = 0;
    virtual void drawText(const std::string& text, float x, float y, const Color& color,
                          TextAlign align = TextAlign::Center) = 0;
};

} // namespace CloudDefenders

#endif // DRAW_CONTEXT_HPP
