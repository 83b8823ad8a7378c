/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/SDLDrawContext.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>

namespace CloudDefenders {

namespace {
constexpr int CIRCLE_SEGMENTS = 32;
constexpr float TWO_PI = 6.28318530718f;
}

bool SDLDrawContext::setColor(const Color& color) {
    if (!mp_renderer) {
        return false;
    }
    if (!SDL_SetRenderDrawColor(mp_renderer, color.r, color.g, color.b, color.a)) {
        PLATFORM_ERROR(std::string("Failed to set draw color: ") + SDL_GetError());
        return false;
    }
    return true;
}

void SDLDrawContext::fillRect(float x, float y, float w, float h, const Color& color) {
    if (!setColor(color)) return;
    const SDL_FRect rect{x, y, w, h};
    SDL_RenderFillRect(mp_renderer, &rect);
}

void SDLDrawContext::strokeRect(float x, float y, float w, float h, const Color& color, float lineWidth) {
    if (!setColor(color)) return;
    const int passes = std::max(1, static_cast<int>(std::lround(lineWidth)));
    for (int i = 0; i < passes; ++i) {
        const float inset = static_cast<float>(i);
        const SDL_FRect rect{x + inset, y + inset, w - inset * 2.0f, h - inset * 2.0f};
        if (rect.w <= 0.0f || rect.h <= 0.0f) break;
        SDL_RenderRect(mp_renderer, &rect);
    }
}

void SDLDrawContext::drawLine(float x1, float y1, float x2, float y2, const Color& color, float lineWidth) {
    if (!setColor(color)) return;

    const int passes = std::max(1, static_cast<int>(std::lround(lineWidth)));
    if (passes == 1) {
        SDL_RenderLine(mp_renderer, x1, y1, x2, y2);
        return;
    }

    // Thick lines as parallel strokes along the normal
    const float dx = x2 - x1;
    const float dy = y2 - y1;
    const float length = std::sqrt(dx * dx + dy * dy);
    if (length <= 0.0f) return;
    const float nx = -dy / length;
    const float ny = dx / length;
    for (int i = 0; i < passes; ++i) {
        const float offset = static_cast<float>(i) - static_cast<float>(passes - 1) * 0.5f;
        SDL_RenderLine(mp_renderer, x1 + nx * offset, y1 + ny * offset, x2 + nx * offset, y2 + ny * offset);
    }
}

void SDLDrawContext::fillCircle(float cx, float cy, float radius, const Color& color) {
    if (radius <= 0.0f || !setColor(color)) return;

    const int r = static_cast<int>(std::ceil(radius));
    for (int dy = -r; dy <= r; ++dy) {
        const float fy = static_cast<float>(dy);
        const float span = radius * radius - fy * fy;
        if (span < 0.0f) continue;
        const float half = std::sqrt(span);
        SDL_RenderLine(mp_renderer, cx - half, cy + fy, cx + half, cy + fy);
    }
}

void SDLDrawContext::strokeCircle(float cx, float cy, float radius, const Color& color, float lineWidth) {
    if (radius <= 0.0f || !setColor(color)) return;

    const int passes = std::max(1, static_cast<int>(std::lround(lineWidth)));
    for (int pass = 0; pass < passes; ++pass) {
        const float r = radius - static_cast<float>(pass);
        if (r <= 0.0f) break;

        SDL_FPoint points[CIRCLE_SEGMENTS + 1];
        for (int i = 0; i <= CIRCLE_SEGMENTS; ++i) {
            const float angle = TWO_PI * static_cast<float>(i) / CIRCLE_SEGMENTS;
            points[i] = SDL_FPoint{cx + std::cos(angle) * r, cy + std::sin(angle) * r};
        }
        SDL_RenderLines(mp_renderer, points, CIRCLE_SEGMENTS + 1);
    }
}

void SDLDrawContext::drawText(const std::string& text, float x, float y, const Color& color, TextAlign align) {
    if (text.empty() || !setColor(color)) return;

    const float glyph = static_cast<float>(SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE);
    const float width = glyph * static_cast<float>(text.size());
    float left = x;
    if (align == TextAlign::Center) {
        left -= width * 0.5f;
    } else if (align == TextAlign::Right) {
        left -= width;
    }
    SDL_RenderDebugText(mp_renderer, left, y - glyph * 0.5f, text.c_str());
}

} // namespace CloudDefenders
