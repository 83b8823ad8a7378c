/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOCK_DRAW_CONTEXT_HPP
#define MOCK_DRAW_CONTEXT_HPP

#include "utils/DrawContext.hpp"
#include <algorithm>
#include <string>
#include <vector>

/**
 * @brief Records draw calls instead of rasterizing them
 */
class MockDrawContext : public CloudDefenders::DrawContext {
public:
    struct Call {
        std::string kind;
        float x{0.0f};
        float y{0.0f};
        CloudDefenders::Color color;
        std::string text;
    };

    void fillRect(float x, float y, float, float, const CloudDefenders::Color& color) override {
        calls.push_back({"fillRect", x, y, color, {}});
    }
    void strokeRect(float x, float y, float, float, const CloudDefenders::Color& color, float) override {
        calls.push_back({"strokeRect", x, y, color, {}});
    }
    void drawLine(float x1, float y1, float, float, const CloudDefenders::Color& color, float) override {
        calls.push_back({"drawLine", x1, y1, color, {}});
    }
    void fillCircle(float cx, float cy, float, const CloudDefenders::Color& color) override {
        calls.push_back({"fillCircle", cx, cy, color, {}});
    }
    void strokeCircle(float cx, float cy, float, const CloudDefenders::Color& color, float) override {
        calls.push_back({"strokeCircle", cx, cy, color, {}});
    }
    void drawText(const std::string& text, float x, float y, const CloudDefenders::Color& color,
                  CloudDefenders::TextAlign) override {
        calls.push_back({"drawText", x, y, color, text});
    }

    bool hasText(const std::string& needle) const {
        return std::any_of(calls.begin(), calls.end(), [&](const Call& call) {
            return call.kind == "drawText" && call.text.find(needle) != std::string::npos;
        });
    }

    size_t count(const std::string& kind) const {
        return static_cast<size_t>(std::count_if(calls.begin(), calls.end(),
            [&](const Call& call) { return call.kind == kind; }));
    }

    void reset() { calls.clear(); }

    std::vector<Call> calls;
};

#endif // MOCK_DRAW_CONTEXT_HPP
