/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_DRAW_CONTEXT_HPP
#define SDL_DRAW_CONTEXT_HPP

#include "utils/DrawContext.hpp"

struct SDL_Renderer;

namespace CloudDefenders {

/**
 * @brief DrawContext backed by the SDL3 2D renderer.
 *
 * Text uses SDL's built-in debug font, so no font assets are required.
 * The renderer is borrowed; GameEngine owns it.
 */
class SDLDrawContext : public DrawContext {
public:
    explicit SDLDrawContext(SDL_Renderer* renderer) : mp_renderer(renderer) {}

    void fillRect(float x, float y, float w, float h, const Color& color) override;
    void strokeRect(float x, float y, float w, float h, const Color& color,
                    float lineWidth = 1.0f) override;
    void drawLine(float x1, float y1, float x2, float y2, const Color& color,
                  float lineWidth = 1.0f) override;
    void fillCircle(float cx, float cy, float radius, const Color& color) override;
    void strokeCircle(float cx, float cy, float radius, const Color& color,
                      float lineWidth = 1.0f) override;
    void drawText(const std::string& text, float x, float y, const Color& color,
                  TextAlign align = TextAlign::Center) override;

private:
    bool setColor(const Color& color);

    SDL_Renderer* mp_renderer{nullptr};
};

} // namespace CloudDefenders

#endif // SDL_DRAW_CONTEXT_HPP
