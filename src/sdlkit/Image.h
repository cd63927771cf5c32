#pragma once

#include <SDL3/SDL.h>
#include <SDL3_image/SDL_image.h>
#include <cstddef>
#include <string>
#include <vector>

namespace sdlkit {

/**
 * SDL3_image loaders and writers.
 *
 * Surfaces and textures are returned as raw SDL pointers owned by the caller
 * (SDL_DestroySurface / SDL_DestroyTexture). Every loader throws Error when
 * SDL3_image returns null.
 */
class Image {
public:
    Image() = delete;

    // Encoded as SDL_VERSIONNUM(major, minor, micro).
    static int version();

    static SDL_Surface* load(const std::string& file);

    // type is a hint such as "PNG" or "BMP"; empty lets SDL3_image detect it.
    static SDL_Surface* load(SDL_IOStream* src, bool closeIO, const std::string& type = std::string());

    static SDL_Texture* loadTexture(SDL_Renderer* renderer, const std::string& file);
    static SDL_Texture* loadTexture(SDL_Renderer* renderer, SDL_IOStream* src, bool closeIO,
                                    const std::string& type = std::string());

    static SDL_Surface* loadIco(SDL_IOStream* src);
    static SDL_Surface* loadCur(SDL_IOStream* src);
    static SDL_Surface* loadBmp(SDL_IOStream* src);
    static SDL_Surface* loadGif(SDL_IOStream* src);
    static SDL_Surface* loadJpg(SDL_IOStream* src);
    static SDL_Surface* loadLbm(SDL_IOStream* src);
    static SDL_Surface* loadPcx(SDL_IOStream* src);
    static SDL_Surface* loadPng(SDL_IOStream* src);
    static SDL_Surface* loadPnm(SDL_IOStream* src);
    static SDL_Surface* loadSvg(SDL_IOStream* src);

    // A zero width or height keeps the aspect ratio of the other one.
    static SDL_Surface* loadSvg(SDL_IOStream* src, int width, int height);

    static SDL_Surface* loadQoi(SDL_IOStream* src);
    static SDL_Surface* loadTga(SDL_IOStream* src);
    static SDL_Surface* loadXcf(SDL_IOStream* src);
    static SDL_Surface* loadXpm(SDL_IOStream* src);
    static SDL_Surface* loadXV(SDL_IOStream* src);

    // XPM image held in memory, one line per element.
    static SDL_Surface* loadXpm(const std::vector<std::string>& lines);
    static SDL_Surface* loadXpm32(const std::vector<std::string>& lines);

    // Format probes. The stream position is left unchanged.
    static bool isIco(SDL_IOStream* src);
    static bool isCur(SDL_IOStream* src);
    static bool isBmp(SDL_IOStream* src);
    static bool isGif(SDL_IOStream* src);
    static bool isJpg(SDL_IOStream* src);
    static bool isLbm(SDL_IOStream* src);
    static bool isPcx(SDL_IOStream* src);
    static bool isPng(SDL_IOStream* src);
    static bool isPnm(SDL_IOStream* src);
    static bool isSvg(SDL_IOStream* src);
    static bool isQoi(SDL_IOStream* src);
    static bool isTga(SDL_IOStream* src);
    static bool isXcf(SDL_IOStream* src);
    static bool isXpm(SDL_IOStream* src);
    static bool isXV(SDL_IOStream* src);

    static void savePng(SDL_Surface* surface, const std::string& file);
    static void savePng(SDL_Surface* surface, SDL_IOStream* dst, bool closeIO);

    // quality ranges 0..100.
    static void saveJpg(SDL_Surface* surface, const std::string& file, int quality);
    static void saveJpg(SDL_Surface* surface, SDL_IOStream* dst, bool closeIO, int quality);
};

// A multi-frame image. Frames belong to the animation and go away with free().
class AnimatedImage {
public:
    AnimatedImage() = default;
    explicit AnimatedImage(IMG_Animation* animation) : handle(animation) {}
    AnimatedImage(std::nullptr_t) {}

    static AnimatedImage load(const std::string& file);
    static AnimatedImage load(SDL_IOStream* src, bool closeIO, const std::string& type = std::string());
    static AnimatedImage loadGif(SDL_IOStream* src);

    void free();

    IMG_Animation* get() const { return handle; }
    explicit operator bool() const { return handle != nullptr; }

    bool operator==(const AnimatedImage& other) const { return handle == other.handle; }
    bool operator!=(const AnimatedImage& other) const { return handle != other.handle; }
    bool operator==(std::nullptr_t) const { return handle == nullptr; }
    bool operator!=(std::nullptr_t) const { return handle != nullptr; }

    int width() const;
    int height() const;
    int frameCount() const;

    // Both throw UsageError for an index outside [0, frameCount()).
    SDL_Surface* frame(int index) const;
    int delay(int index) const;

private:
    void checkIndex(int index) const;

    IMG_Animation* handle = nullptr;
};

} // namespace sdlkit
