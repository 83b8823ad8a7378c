/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_ENGINE_HPP
#define GAME_ENGINE_HPP

#include "core/GameSettings.hpp"
#include "core/SDLFrameScheduler.hpp"
#include "ui/ModalPresenter.hpp"
#include <SDL3/SDL.h>
#include <array>
#include <memory>
#include <string_view>

class GameLoop;
class GameSession;

namespace CloudDefenders {
class SDLDrawContext;
}

/**
 * @brief Desktop host for a GameSession.
 *
 * Owns the SDL window and renderer, pumps input into the session, and
 * drives the GameLoop through an SDLFrameScheduler, one dispatch per
 * presented frame.
 *
 * Controls:
 *   SPACE   start / pause / resume
 *   R       restart to the menu
 *   1-8     select the defence placed by a left click
 *   RMB     launch a countermeasure at the cursor
 *   ESC     quit
 */
class GameEngine : public CloudDefenders::ModalPresenter {
public:
    GameEngine();
    ~GameEngine() override;

    GameEngine(const GameEngine&) = delete;
    GameEngine& operator=(const GameEngine&) = delete;

    /**
     * @brief Creates the window, renderer, session and loop.
     * @return false if any SDL step fails (logged); call clean() afterwards
     */
    bool init(std::string_view title, const CloudDefenders::GameSettings& settings, bool fullscreen);

    // Blocks until the window closes or ESC is pressed
    void run();
    void clean();

    void handleEvents();
    void render();

    bool isRunning() const { return m_isRunning; }
    void setRunning(bool running) { m_isRunning = running; }

    void showModal(const std::string& title, const std::string& message, int score) override;

    GameSession* getSession() const noexcept { return mp_session.get(); }
    SDL_Renderer* getRenderer() const noexcept { return mp_renderer.get(); }
    SDL_Window* getWindow() const noexcept { return mp_window.get(); }

private:
    void handleKeyDown(SDL_Keycode key);
    void handleMouseDown(Uint8 button, float x, float y);

    static constexpr std::array<std::string_view, 8> DEFENSE_HOTKEYS = {
        "firewall", "antivirus", "waf", "ddos-protection",
        "encryption", "monitoring", "backup", "shield-node"
    };

    std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{nullptr, SDL_DestroyWindow};
    std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{nullptr, SDL_DestroyRenderer};
    std::unique_ptr<CloudDefenders::SDLDrawContext> mp_drawContext;
    std::unique_ptr<GameSession> mp_session;
    std::unique_ptr<GameLoop> mp_gameLoop;
    SDLFrameScheduler m_scheduler;

    size_t m_selectedDefense{0};
    bool m_vsyncEnabled{false};
    bool m_isRunning{false};
    bool m_sdlInitialized{false};
};

#endif // GAME_ENGINE_HPP
