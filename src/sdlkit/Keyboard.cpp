#include "sdlkit/Keyboard.h"
#include "sdlkit/Error.h"
#include "sdlkit/Marshal.h"

namespace sdlkit {

bool KeyboardState::isPressed(SDL_Scancode scancode) const {
    int index = static_cast<int>(scancode);
    if (!keys || index < 0 || index >= count) {
        return false;
    }
    return keys[index];
}

std::string Keyboard::name() const {
    return toString(SDL_GetKeyboardNameForID(handle));
}

bool Keyboard::hasKeyboard() {
    return SDL_HasKeyboard();
}

std::vector<Keyboard> Keyboard::keyboards() {
    int count = 0;
    std::vector<SDL_KeyboardID> ids = takeArray(SDL_GetKeyboards(&count), count);

    std::vector<Keyboard> result;
    result.reserve(ids.size());
    for (SDL_KeyboardID id : ids) {
        result.emplace_back(id);
    }
    return result;
}

SDL_Window* Keyboard::focus() {
    return SDL_GetKeyboardFocus();
}

KeyboardState Keyboard::state() {
    int count = 0;
    const bool* keys = SDL_GetKeyboardState(&count);
    return KeyboardState(keys, count);
}

SDL_Keymod Keyboard::modState() {
    return SDL_GetModState();
}

void Keyboard::setModState(SDL_Keymod modState) {
    SDL_SetModState(modState);
}

void Keyboard::reset() {
    SDL_ResetKeyboard();
}

bool Keyboard::hasScreenKeyboardSupport() {
    return SDL_HasScreenKeyboardSupport();
}

bool Keyboard::isScreenKeyboardShown(SDL_Window* window) {
    return SDL_ScreenKeyboardShown(window);
}

void Keyboard::startTextInput(SDL_Window* window) {
    checkSdl(SDL_StartTextInput(window));
}

void Keyboard::stopTextInput(SDL_Window* window) {
    checkSdl(SDL_StopTextInput(window));
}

bool Keyboard::isTextInputActive(SDL_Window* window) {
    return SDL_TextInputActive(window);
}

void Keyboard::setTextInputArea(SDL_Window* window, const SDL_Rect& area, int cursor) {
    checkSdl(SDL_SetTextInputArea(window, &area, cursor));
}

void Keyboard::clearComposition(SDL_Window* window) {
    checkSdl(SDL_ClearComposition(window));
}

SDL_Keycode Keyboard::keyFromScancode(SDL_Scancode scancode, SDL_Keymod modState, bool keyEvent) {
    return SDL_GetKeyFromScancode(scancode, modState, keyEvent);
}

SDL_Scancode Keyboard::scancodeFromKey(SDL_Keycode key, SDL_Keymod* modState) {
    return SDL_GetScancodeFromKey(key, modState);
}

std::string Keyboard::scancodeName(SDL_Scancode scancode) {
    return toString(SDL_GetScancodeName(scancode));
}

// SDL keeps the pointer; the string must outlive its use.
void Keyboard::setScancodeName(SDL_Scancode scancode, const char* name) {
    checkSdl(SDL_SetScancodeName(scancode, name));
}

SDL_Scancode Keyboard::scancodeFromName(const std::string& name) {
    return SDL_GetScancodeFromName(name.c_str());
}

std::string Keyboard::keyName(SDL_Keycode key) {
    return toString(SDL_GetKeyName(key));
}

SDL_Keycode Keyboard::keyFromName(const std::string& name) {
    return SDL_GetKeyFromName(name.c_str());
}

} // namespace sdlkit
