#pragma once

#include "sdlkit/Context.h"
#include "sdlkit/Gamepad.h"
#include "sdlkit/TimerMailbox.h"

#include <SDL3/SDL.h>
#include <map>
#include <memory>
#include <string>

/**
 * Interactive device probe. Brings SDL up from a JSON config, prints the
 * connected input devices and then logs hot-plug and input events.
 *
 * Keys: F1 prints the device report again, Escape quits.
 */
class InputProbe {
public:
    explicit InputProbe(const sdlkit::InitConfig& config);
    ~InputProbe();

    static SDL_AppResult AppInit(void** appstate, int argc, char** argv);
    static SDL_AppResult AppIterate(void* appstate);
    static SDL_AppResult AppEvent(void* appstate, SDL_Event* event);
    static void AppQuit(void* appstate, SDL_AppResult result);

private:
    // Constants
    static const int WINDOW_WIDTH = 800;
    static const int WINDOW_HEIGHT = 480;
    static const Uint32 HEARTBEAT_MS = 1000;

    // SDL
    std::unique_ptr<sdlkit::Context> context;
    SDL_Window* window;
    SDL_Renderer* renderer;

    // Heartbeat timer, fired on SDL's timer thread and drained here
    std::unique_ptr<sdlkit::TimerMailbox> mailbox;
    sdlkit::TimerID heartbeatTimer;
    Uint64 heartbeats;

    // Gamepads opened on hot-plug, by joystick id
    std::map<SDL_JoystickID, sdlkit::Gamepad> gamepads;

    std::string lastEvent;

    bool initialize();
    void printReport() const;

    SDL_AppResult handleEvent(SDL_Event* event);
    void handleKeyPress(const SDL_KeyboardEvent& key);
    void handleGamepadAdded(SDL_JoystickID id);
    void handleGamepadRemoved(SDL_JoystickID id);

    void update();
    void render();
    void cleanup();
};
