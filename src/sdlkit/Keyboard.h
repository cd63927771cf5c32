#pragma once

#include <SDL3/SDL.h>
#include <cstddef>
#include <string>
#include <vector>

namespace sdlkit {

// Snapshot pointer into SDL's internal key state array. Valid for the whole
// application lifetime; updated as events are pumped.
class KeyboardState {
public:
    KeyboardState() = default;
    KeyboardState(const bool* keys, int count) : keys(keys), count(count) {}

    // False for out-of-range scancodes.
    bool isPressed(SDL_Scancode scancode) const;
    int size() const { return count; }

private:
    const bool* keys = nullptr;
    int count = 0;
};

/**
 * A keyboard attached to the system, identified by its SDL_KeyboardID.
 * A Keyboard compares equal to nullptr when it holds id 0.
 */
class Keyboard {
public:
    Keyboard() = default;
    explicit Keyboard(SDL_KeyboardID id) : handle(id) {}
    Keyboard(std::nullptr_t) {}

    SDL_KeyboardID id() const { return handle; }
    explicit operator bool() const { return handle != 0; }

    bool operator==(const Keyboard& other) const { return handle == other.handle; }
    bool operator!=(const Keyboard& other) const { return handle != other.handle; }
    bool operator==(std::nullptr_t) const { return handle == 0; }
    bool operator!=(std::nullptr_t) const { return handle != 0; }

    std::string name() const;

    static bool hasKeyboard();
    static std::vector<Keyboard> keyboards();
    static SDL_Window* focus();
    static KeyboardState state();

    static SDL_Keymod modState();
    static void setModState(SDL_Keymod modState);

    // Clears all pressed keys and sends key-up events for them.
    static void reset();

    static bool hasScreenKeyboardSupport();
    static bool isScreenKeyboardShown(SDL_Window* window);

    // Text input (IME) per window. Throw Error on failure.
    static void startTextInput(SDL_Window* window);
    static void stopTextInput(SDL_Window* window);
    static bool isTextInputActive(SDL_Window* window);
    static void setTextInputArea(SDL_Window* window, const SDL_Rect& area, int cursor);
    static void clearComposition(SDL_Window* window);

    // Scancode / keycode translation.
    static SDL_Keycode keyFromScancode(SDL_Scancode scancode, SDL_Keymod modState = SDL_KMOD_NONE, bool keyEvent = false);
    static SDL_Scancode scancodeFromKey(SDL_Keycode key, SDL_Keymod* modState = nullptr);
    static std::string scancodeName(SDL_Scancode scancode);
    static void setScancodeName(SDL_Scancode scancode, const char* name);
    static SDL_Scancode scancodeFromName(const std::string& name);
    static std::string keyName(SDL_Keycode key);
    static SDL_Keycode keyFromName(const std::string& name);

private:
    SDL_KeyboardID handle = 0;
};

} // namespace sdlkit
