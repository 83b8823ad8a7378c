/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameEngine.hpp"
#include "core/GameLoop.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "utils/SDLDrawContext.hpp"
#include <string>

namespace {
// Fallback pacing when VSync is unavailable
constexpr Uint32 SOFTWARE_FRAME_DELAY_MS = 16;
}

GameEngine::GameEngine() = default;

GameEngine::~GameEngine() {
    clean();
}

bool GameEngine::init(std::string_view title, const CloudDefenders::GameSettings& settings, bool fullscreen) {
    PLATFORM_INFO("Initializing SDL Video");

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        PLATFORM_CRITICAL(std::string("SDL initialization failed: ") + SDL_GetError());
        return false;
    }
    m_sdlInitialized = true;

    const int width = static_cast<int>(settings.playfieldWidth);
    const int height = static_cast<int>(settings.playfieldHeight);
    const SDL_WindowFlags flags = fullscreen ? SDL_WINDOW_FULLSCREEN : SDL_WINDOW_RESIZABLE;

    const std::string windowTitle(title);
    mp_window.reset(SDL_CreateWindow(windowTitle.c_str(), width, height, flags));
    if (!mp_window) {
        PLATFORM_ERROR(std::string("Failed to create window: ") + SDL_GetError());
        return false;
    }

    mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));
    if (!mp_renderer) {
        PLATFORM_ERROR(std::string("Failed to create renderer: ") + SDL_GetError());
        return false;
    }

    // The simulation works in playfield units regardless of window size
    if (!SDL_SetRenderLogicalPresentation(mp_renderer.get(), width, height,
                                          SDL_LOGICAL_PRESENTATION_LETTERBOX)) {
        PLATFORM_ERROR(std::string("Failed to set render logical presentation: ") + SDL_GetError());
        return false;
    }

    m_vsyncEnabled = SDL_SetRenderVSync(mp_renderer.get(), 1);
    if (!m_vsyncEnabled) {
        PLATFORM_WARN(std::string("VSync unavailable, using software frame limiting: ") + SDL_GetError());
    }
    SDL_SetRenderDrawBlendMode(mp_renderer.get(), SDL_BLENDMODE_BLEND);

    mp_drawContext = std::make_unique<CloudDefenders::SDLDrawContext>(mp_renderer.get());

    mp_session = std::make_unique<GameSession>(settings);
    mp_session->setModalPresenter(this);

    mp_gameLoop = std::make_unique<GameLoop>(m_scheduler, settings.tickRate, settings.maxAccumulatorTicks);
    mp_gameLoop->setCallbacks(
        [this](float deltaTime) { mp_session->update(deltaTime); },
        [this]() { render(); });

    m_isRunning = true;
    PLATFORM_INFO("Platform layer online");
    return true;
}

void GameEngine::run() {
    if (!mp_gameLoop || !mp_gameLoop->start()) {
        PLATFORM_ERROR("Game loop failed to start");
        return;
    }

    while (m_isRunning) {
        handleEvents();
        if (!m_scheduler.dispatch()) {
            PLATFORM_ERROR("Game loop stopped requesting frames");
            break;
        }
        if (!m_vsyncEnabled) {
            SDL_Delay(SOFTWARE_FRAME_DELAY_MS);
        }
    }

    mp_gameLoop->stop();
}

void GameEngine::handleEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_EVENT_QUIT:
            m_isRunning = false;
            break;
        case SDL_EVENT_KEY_DOWN:
            if (!event.key.repeat) {
                handleKeyDown(event.key.key);
            }
            break;
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
            // Window pixels -> playfield units
            SDL_ConvertEventToRenderCoordinates(mp_renderer.get(), &event);
            handleMouseDown(event.button.button, event.button.x, event.button.y);
            break;
        default:
            break;
        }
    }
}

void GameEngine::handleKeyDown(SDL_Keycode key) {
    switch (key) {
    case SDLK_ESCAPE:
        m_isRunning = false;
        break;
    case SDLK_SPACE:
        if (mp_session->isPlaying()) {
            mp_session->pauseGame();
        } else {
            mp_session->startGame();
        }
        break;
    case SDLK_R:
        mp_session->restartGame();
        break;
    default:
        if (key >= SDLK_1 && key <= SDLK_8) {
            m_selectedDefense = static_cast<size_t>(key - SDLK_1);
            PLATFORM_DEBUG("Selected defence: " + std::string(DEFENSE_HOTKEYS[m_selectedDefense]));
        }
        break;
    }
}

void GameEngine::handleMouseDown(Uint8 button, float x, float y) {
    if (button == SDL_BUTTON_LEFT) {
        mp_session->deployDefense(DEFENSE_HOTKEYS[m_selectedDefense], x, y);
    } else if (button == SDL_BUTTON_RIGHT) {
        mp_session->launchBomb(x, y);
    }
}

void GameEngine::render() {
    SDL_SetRenderDrawColor(mp_renderer.get(), 0, 0, 0, 255);
    SDL_RenderClear(mp_renderer.get());
    mp_session->render(*mp_drawContext);
    SDL_RenderPresent(mp_renderer.get());
}

void GameEngine::showModal(const std::string& title, const std::string& message, int score) {
    PLATFORM_INFO(title + " - final score " + std::to_string(score));
    if (!SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_INFORMATION, title.c_str(), message.c_str(), mp_window.get())) {
        PLATFORM_ERROR(std::string("Failed to show message box: ") + SDL_GetError());
    }
}

void GameEngine::clean() {
    if (!m_sdlInitialized) return;

    // Loop first: its destructor cancels the pending frame
    mp_gameLoop.reset();
    mp_session.reset();
    mp_drawContext.reset();
    mp_renderer.reset();
    mp_window.reset();

    SDL_Quit();
    m_sdlInitialized = false;
    m_isRunning = false;
    PLATFORM_INFO("Shutdown complete");
}
