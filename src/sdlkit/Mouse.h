#pragma once

#include <SDL3/SDL.h>
#include <cstddef>
#include <string>
#include <vector>

namespace sdlkit {

struct MouseState {
    SDL_MouseButtonFlags buttons = 0;
    float x = 0.0f;
    float y = 0.0f;

    bool isDown(int button) const { return (buttons & SDL_BUTTON_MASK(button)) != 0; }
};

class Mouse {
public:
    Mouse() = default;
    explicit Mouse(SDL_MouseID id) : handle(id) {}
    Mouse(std::nullptr_t) {}

    SDL_MouseID id() const { return handle; }
    explicit operator bool() const { return handle != 0; }

    bool operator==(const Mouse& other) const { return handle == other.handle; }
    bool operator!=(const Mouse& other) const { return handle != other.handle; }
    bool operator==(std::nullptr_t) const { return handle == 0; }
    bool operator!=(std::nullptr_t) const { return handle != 0; }

    std::string name() const;

    // Pseudo-devices used for mouse events synthesized from touch and pen input.
    static Mouse touch() { return Mouse(SDL_TOUCH_MOUSEID); }
    static Mouse pen() { return Mouse(SDL_PEN_MOUSEID); }

    static bool hasMouse();
    static std::vector<Mouse> mice();
    static SDL_Window* focus();

    // Position relative to the focus window, the desktop, or since the last call.
    static MouseState state();
    static MouseState globalState();
    static MouseState relativeState();

    static void warpInWindow(SDL_Window* window, float x, float y);
    static void warpGlobal(float x, float y);
    static void capture(bool enabled);

    static void setRelativeMode(SDL_Window* window, bool enabled);
    static bool relativeMode(SDL_Window* window);

private:
    SDL_MouseID handle = 0;
};

/**
 * Non-owning cursor handle. Cursors created here must be released with free().
 */
class Cursor {
public:
    Cursor() = default;
    explicit Cursor(SDL_Cursor* cursor) : handle(cursor) {}
    Cursor(std::nullptr_t) {}

    // Monochrome cursor from 1-bit data and mask bitmaps; w must be a multiple of 8.
    static Cursor create(const Uint8* data, const Uint8* mask, int w, int h, int hotX, int hotY);
    static Cursor create(SDL_Surface* surface, int hotX, int hotY);
    static Cursor create(SDL_SystemCursor systemCursor);

    void free();

    SDL_Cursor* get() const { return handle; }
    explicit operator bool() const { return handle != nullptr; }

    bool operator==(const Cursor& other) const { return handle == other.handle; }
    bool operator!=(const Cursor& other) const { return handle != other.handle; }
    bool operator==(std::nullptr_t) const { return handle == nullptr; }
    bool operator!=(std::nullptr_t) const { return handle != nullptr; }

    static void show();
    static void hide();
    static bool isVisible();
    static void setVisible(bool visible);

    static Cursor active();
    static void setActive(const Cursor& cursor);
    static Cursor defaultCursor();

private:
    SDL_Cursor* handle = nullptr;
};

} // namespace sdlkit
