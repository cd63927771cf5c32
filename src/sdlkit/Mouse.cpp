#include "sdlkit/Mouse.h"
#include "sdlkit/Error.h"
#include "sdlkit/Marshal.h"

namespace sdlkit {

// ============================================================================
//                     Mouse
// ============================================================================

std::string Mouse::name() const {
    return toString(SDL_GetMouseNameForID(handle));
}

bool Mouse::hasMouse() {
    return SDL_HasMouse();
}

std::vector<Mouse> Mouse::mice() {
    int count = 0;
    std::vector<SDL_MouseID> ids = takeArray(SDL_GetMice(&count), count);

    std::vector<Mouse> result;
    result.reserve(ids.size());
    for (SDL_MouseID id : ids) {
        result.emplace_back(id);
    }
    return result;
}

SDL_Window* Mouse::focus() {
    return SDL_GetMouseFocus();
}

MouseState Mouse::state() {
    MouseState result;
    result.buttons = SDL_GetMouseState(&result.x, &result.y);
    return result;
}

MouseState Mouse::globalState() {
    MouseState result;
    result.buttons = SDL_GetGlobalMouseState(&result.x, &result.y);
    return result;
}

MouseState Mouse::relativeState() {
    MouseState result;
    result.buttons = SDL_GetRelativeMouseState(&result.x, &result.y);
    return result;
}

void Mouse::warpInWindow(SDL_Window* window, float x, float y) {
    SDL_WarpMouseInWindow(window, x, y);
}

void Mouse::warpGlobal(float x, float y) {
    checkSdl(SDL_WarpMouseGlobal(x, y));
}

void Mouse::capture(bool enabled) {
    checkSdl(SDL_CaptureMouse(enabled));
}

void Mouse::setRelativeMode(SDL_Window* window, bool enabled) {
    checkSdl(SDL_SetWindowRelativeMouseMode(window, enabled));
}

bool Mouse::relativeMode(SDL_Window* window) {
    return SDL_GetWindowRelativeMouseMode(window);
}

// ============================================================================
//                     Cursor
// ============================================================================

Cursor Cursor::create(const Uint8* data, const Uint8* mask, int w, int h, int hotX, int hotY) {
    return Cursor(checkHandle(SDL_CreateCursor(data, mask, w, h, hotX, hotY)));
}

Cursor Cursor::create(SDL_Surface* surface, int hotX, int hotY) {
    return Cursor(checkHandle(SDL_CreateColorCursor(surface, hotX, hotY)));
}

Cursor Cursor::create(SDL_SystemCursor systemCursor) {
    return Cursor(checkHandle(SDL_CreateSystemCursor(systemCursor)));
}

void Cursor::free() {
    SDL_DestroyCursor(handle);
    handle = nullptr;
}

void Cursor::show() {
    checkSdl(SDL_ShowCursor());
}

void Cursor::hide() {
    checkSdl(SDL_HideCursor());
}

bool Cursor::isVisible() {
    return SDL_CursorVisible();
}

void Cursor::setVisible(bool visible) {
    if (visible) {
        show();
    } else {
        hide();
    }
}

Cursor Cursor::active() {
    return Cursor(SDL_GetCursor());
}

void Cursor::setActive(const Cursor& cursor) {
    checkSdl(SDL_SetCursor(cursor.handle));
}

Cursor Cursor::defaultCursor() {
    return Cursor(checkHandle(SDL_GetDefaultCursor()));
}

} // namespace sdlkit
