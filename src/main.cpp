/*******************************************************************************
 * main.cpp
 *
 * Entry point for sdlkit-probe. Wires SDL's main callbacks to InputProbe.
 *
 * Usage: sdlkit-probe [config.json]
 ******************************************************************************/

#include "InputProbe.h"
#include <cstdio>

#define SDL_MAIN_USE_CALLBACKS
#include <SDL3/SDL_main.h>

// SDL3 main callbacks entry point
SDL_AppResult SDL_AppInit(void** appstate, int argc, char* argv[]) {
    printf("\n[MAIN] Starting sdlkit probe...\n");

    if (argc > 2) {
        printf("Usage: %s [config.json]\n", argv[0]);
        return SDL_APP_FAILURE;
    }

    return InputProbe::AppInit(appstate, argc, argv);
}

SDL_AppResult SDL_AppIterate(void* appstate) {
    return InputProbe::AppIterate(appstate);
}

SDL_AppResult SDL_AppEvent(void* appstate, SDL_Event* event) {
    return InputProbe::AppEvent(appstate, event);
}

void SDL_AppQuit(void* appstate, SDL_AppResult result) {
    InputProbe::AppQuit(appstate, result);
}
