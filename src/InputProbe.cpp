/*******************************************************************************
 * InputProbe.cpp
 *
 * Device probe built on sdlkit:
 * - SDL main callbacks drive the loop, sdlkit::Context owns SDL_Init/SDL_Quit
 * - A TimerMailbox heartbeat fires on SDL's timer thread and is drained here
 * - Gamepads are opened on hot-plug and their input is logged
******************************************************************************/

#include "InputProbe.h"
#include "sdlkit/DeviceReport.h"
#include "sdlkit/Error.h"
#include "sdlkit/Keyboard.h"
#include "sdlkit/Time.h"

#include <algorithm>
#include <cstdio>
#include <iostream>

/*-----------------------------------------------------------------------------
 *                          CONSTRUCTOR / DESTRUCTOR
*---------------------------------------------------------------------------*/

InputProbe::InputProbe(const sdlkit::InitConfig& config)
    : context(std::make_unique<sdlkit::Context>(config))
    , window(nullptr), renderer(nullptr)
    , heartbeatTimer(0), heartbeats(0) {
    std::cout << "[PROBE] SDL initialized, " << context->mappingsLoaded() << " gamepad mapping(s) loaded" << std::endl;
}

InputProbe::~InputProbe() {
    cleanup();
}

/*-----------------------------------------------------------------------------
 *                          SDL CALLBACK FUNCTIONS
*---------------------------------------------------------------------------*/


/**
 *  AppInit: Reads the config, brings SDL up and creates the probe.
 *  - argv[1], when present, names a JSON config file
 *  - The video subsystem is always added so the probe can open its window
 */
SDL_AppResult InputProbe::AppInit(void** appstate, int argc, char* argv[]) {
    printf("[AppInit] Loading configuration...\n");

    sdlkit::InitConfig config;
    config.subsystems = {"video", "gamepad", "sensor"};
    config.app.name = "sdlkit probe";
    config.app.identifier = "org.sdlkit.probe";

    InputProbe* probe = nullptr;
    try {
        if (argc > 1) {
            config = sdlkit::InitConfig::fromFile(argv[1]);
        }
        if (std::find(config.subsystems.begin(), config.subsystems.end(), "video") == config.subsystems.end()) {
            config.subsystems.push_back("video");
        }

        probe = new InputProbe(config);
    } catch (const std::exception& e) {
        std::cerr << "[AppInit] " << e.what() << std::endl;
        return SDL_APP_FAILURE;
    }

    if (!probe->initialize()) {
        delete probe;
        return SDL_APP_FAILURE;
    }

    *appstate = probe;
    return SDL_APP_CONTINUE;
}


/**
 *  AppIterate: Drains the heartbeat mailbox and redraws.
 *
 *  @param appstate pointer to the InputProbe instance
 *  @return SDL_APP_CONTINUE to keep running
 */
SDL_AppResult InputProbe::AppIterate(void* appstate) {
    InputProbe* probe = static_cast<InputProbe*>(appstate);

    if (!probe) {
        std::cerr << "[AppIterate] Probe pointer is null!" << std::endl;
        return SDL_APP_FAILURE;
    }

    // Handle minimized window (pause rendering)
    if (SDL_GetWindowFlags(probe->window) & SDL_WINDOW_MINIMIZED) {
        SDL_WaitEvent(nullptr);
        return SDL_APP_CONTINUE;
    }

    probe->update();
    probe->render();
    return SDL_APP_CONTINUE;
}


/**
 *  AppEvent: Logs device and input events.
 *
 * @param appstate pointer to the InputProbe instance
 * @param event SDL_Event to process
 * @return SDL_APP_SUCCESS to quit, SDL_APP_CONTINUE to keep running
 */
SDL_AppResult InputProbe::AppEvent(void* appstate, SDL_Event* event) {
    InputProbe* probe = static_cast<InputProbe*>(appstate);

    if (!probe) {
        std::cerr << "[AppEvent] Probe pointer is null!" << std::endl;
        return SDL_APP_FAILURE;
    }

    if (event->type == SDL_EVENT_QUIT) {
        return SDL_APP_SUCCESS;
    }

    return probe->handleEvent(event);
}

/**
 * AppQuit: Deletes the probe. Its Context shuts SDL down.
 *
 * @param appstate pointer to the InputProbe instance
 * @param result the result code from the main loop (success or failure)
 */
void InputProbe::AppQuit(void* appstate, SDL_AppResult result) {
    InputProbe* probe = static_cast<InputProbe*>(appstate);

    if (probe) {
        printf("[AppQuit] Cleaning up...\n");
        delete probe;
    }

    printf("[AppQuit] Shutdown complete (%s)\n", result == SDL_APP_FAILURE ? "failure" : "success");
}

/*-----------------------------------------------------------------------------
 *                          INITIALIZATION
*---------------------------------------------------------------------------*/


/**
 * Creates the window and renderer, prints the device report and starts the
 * heartbeat timer.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool InputProbe::initialize() {
    printf("[AppInit] Creating window and renderer...\n");

    window = SDL_CreateWindow("sdlkit probe", WINDOW_WIDTH, WINDOW_HEIGHT, 0);
    if (!window) {
        std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer = SDL_CreateRenderer(window, nullptr);
    if (!renderer) {
        std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
        return false;
    }

    SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
    SDL_ShowWindow(window);

    printReport();

    try {
        mailbox = std::make_unique<sdlkit::TimerMailbox>();
        heartbeatTimer = mailbox->start(HEARTBEAT_MS);
    } catch (const std::exception& e) {
        std::cerr << "[AppInit] Heartbeat timer failed: " << e.what() << std::endl;
        return false;
    }

    printf("Probe initialized successfully. F1: device report, Escape: quit\n");
    return true;
}

void InputProbe::printReport() const {
    try {
        std::cout << "[PROBE] Devices:\n" << sdlkit::DeviceReport::build().dump(2) << std::endl;
    } catch (const sdlkit::Error& e) {
        std::cerr << "[PROBE] Device report failed: " << e.what() << std::endl;
    }
}

/*-----------------------------------------------------------------------------
 *                          EVENTS
*---------------------------------------------------------------------------*/

SDL_AppResult InputProbe::handleEvent(SDL_Event* event) {
    switch (event->type) {
        case SDL_EVENT_KEY_DOWN:
            if (event->key.key == SDLK_ESCAPE) {
                return SDL_APP_SUCCESS;
            }
            handleKeyPress(event->key);
            break;

        case SDL_EVENT_MOUSE_BUTTON_DOWN:
            lastEvent = "mouse " + std::to_string(event->button.which) + " button " +
                        std::to_string(event->button.button) + " at " +
                        std::to_string(static_cast<int>(event->button.x)) + "," +
                        std::to_string(static_cast<int>(event->button.y));
            std::cout << "[PROBE] " << lastEvent << std::endl;
            break;

        case SDL_EVENT_JOYSTICK_ADDED:
            std::cout << "[PROBE] Joystick added: " << sdlkit::JoystickID(event->jdevice.which).name() << std::endl;
            break;

        case SDL_EVENT_JOYSTICK_REMOVED:
            std::cout << "[PROBE] Joystick removed: " << event->jdevice.which << std::endl;
            break;

        case SDL_EVENT_GAMEPAD_ADDED:
            handleGamepadAdded(event->gdevice.which);
            break;

        case SDL_EVENT_GAMEPAD_REMOVED:
            handleGamepadRemoved(event->gdevice.which);
            break;

        case SDL_EVENT_GAMEPAD_BUTTON_DOWN:
            lastEvent = "gamepad " + std::to_string(event->gbutton.which) + " button " +
                        sdlkit::gamepadButtonToString(static_cast<SDL_GamepadButton>(event->gbutton.button));
            std::cout << "[PROBE] " << lastEvent << std::endl;
            break;

        case SDL_EVENT_GAMEPAD_AXIS_MOTION:
            // Ignore noise around the center
            if (event->gaxis.value > 8000 || event->gaxis.value < -8000) {
                lastEvent = "gamepad " + std::to_string(event->gaxis.which) + " axis " +
                            sdlkit::gamepadAxisToString(static_cast<SDL_GamepadAxis>(event->gaxis.axis)) +
                            " = " + std::to_string(event->gaxis.value);
            }
            break;

        default:
            break;
    }

    return SDL_APP_CONTINUE;
}

void InputProbe::handleKeyPress(const SDL_KeyboardEvent& key) {
    if (key.key == SDLK_F1) {
        printReport();
        return;
    }

    lastEvent = "key " + sdlkit::Keyboard::keyName(key.key) + " (" +
                sdlkit::Keyboard::scancodeName(key.scancode) + ") on keyboard " + std::to_string(key.which);
    std::cout << "[PROBE] " << lastEvent << std::endl;
}

void InputProbe::handleGamepadAdded(SDL_JoystickID id) {
    try {
        sdlkit::Gamepad gamepad = sdlkit::Gamepad::open(sdlkit::GamepadID(id));
        std::cout << "[PROBE] Gamepad added: " << gamepad.name()
                  << " (" << sdlkit::gamepadKindToString(gamepad.kind()) << ")" << std::endl;
        gamepads[id] = gamepad;
    } catch (const sdlkit::Error& e) {
        std::cerr << "[PROBE] Failed to open gamepad " << id << ": " << e.what() << std::endl;
    }
}

void InputProbe::handleGamepadRemoved(SDL_JoystickID id) {
    auto it = gamepads.find(id);
    if (it == gamepads.end()) {
        return;
    }

    std::cout << "[PROBE] Gamepad removed: " << id << std::endl;
    it->second.close();
    gamepads.erase(it);
}

/*-----------------------------------------------------------------------------
 *                          UPDATE / RENDER
*---------------------------------------------------------------------------*/

void InputProbe::update() {
    mailbox->poll([this](const sdlkit::TimerFiring& firing) {
        ++heartbeats;
        std::cout << "[PROBE] Heartbeat " << heartbeats << " (timer " << firing.timerID
                  << ", " << sdlkit::nsToMS(firing.intervalNs) << " ms)" << std::endl;
    });
}

void InputProbe::render() {
    // Background alternates with every heartbeat
    Uint8 shade = (heartbeats % 2 == 0) ? 32 : 48;
    SDL_SetRenderDrawColor(renderer, shade, shade, shade + 16, 255);
    SDL_RenderClear(renderer);

    SDL_SetRenderDrawColor(renderer, 230, 230, 230, 255);
    SDL_RenderDebugText(renderer, 16.0f, 16.0f, "sdlkit probe - F1: device report, Esc: quit");

    std::string status = "heartbeats: " + std::to_string(heartbeats) +
                         "  gamepads: " + std::to_string(gamepads.size()) +
                         "  uptime: " + std::to_string(sdlkit::getTicks() / 1000) + " s";
    SDL_RenderDebugText(renderer, 16.0f, 40.0f, status.c_str());

    if (!lastEvent.empty()) {
        SDL_RenderDebugText(renderer, 16.0f, 64.0f, lastEvent.c_str());
    }

    SDL_RenderPresent(renderer);
}

/*-----------------------------------------------------------------------------
 *                          CLEANUP
*---------------------------------------------------------------------------*/

void InputProbe::cleanup() {
    // Timers go first, while SDL is still running
    mailbox.reset();
    heartbeatTimer = 0;

    for (auto& entry : gamepads) {
        entry.second.close();
    }
    gamepads.clear();

    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }

    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }

    context.reset();
    std::cout << "[PROBE] Cleanup complete" << std::endl;
}
