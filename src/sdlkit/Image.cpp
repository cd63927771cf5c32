#include "sdlkit/Image.h"
#include "sdlkit/Error.h"
#include "sdlkit/Log.h"

namespace sdlkit {

namespace {

const char* typeOrNull(const std::string& type) {
    return type.empty() ? nullptr : type.c_str();
}

// SDL3_image takes the XPM lines as char**. Keep the copies alive for the call.
std::vector<char*> xpmLines(std::vector<std::string>& copies) {
    std::vector<char*> lines;
    lines.reserve(copies.size() + 1);
    for (std::string& line : copies) {
        lines.push_back(line.data());
    }
    lines.push_back(nullptr);
    return lines;
}

} // namespace

// ============================================================================
//                     Image: generic loaders
// ============================================================================

int Image::version() {
    return IMG_Version();
}

SDL_Surface* Image::load(const std::string& file) {
    SDL_Surface* surface = IMG_Load(file.c_str());
    if (!surface) {
        log::debug("IMAGE", "Failed to load " + file);
    }
    return checkHandle(surface);
}

SDL_Surface* Image::load(SDL_IOStream* src, bool closeIO, const std::string& type) {
    if (type.empty()) {
        return checkHandle(IMG_Load_IO(src, closeIO));
    }
    return checkHandle(IMG_LoadTyped_IO(src, closeIO, type.c_str()));
}

SDL_Texture* Image::loadTexture(SDL_Renderer* renderer, const std::string& file) {
    return checkHandle(IMG_LoadTexture(renderer, file.c_str()));
}

SDL_Texture* Image::loadTexture(SDL_Renderer* renderer, SDL_IOStream* src, bool closeIO, const std::string& type) {
    if (type.empty()) {
        return checkHandle(IMG_LoadTexture_IO(renderer, src, closeIO));
    }
    return checkHandle(IMG_LoadTextureTyped_IO(renderer, src, closeIO, type.c_str()));
}

// ============================================================================
//                     Image: format loaders
// ============================================================================

SDL_Surface* Image::loadIco(SDL_IOStream* src) { return checkHandle(IMG_LoadICO_IO(src)); }
SDL_Surface* Image::loadCur(SDL_IOStream* src) { return checkHandle(IMG_LoadCUR_IO(src)); }
SDL_Surface* Image::loadBmp(SDL_IOStream* src) { return checkHandle(IMG_LoadBMP_IO(src)); }
SDL_Surface* Image::loadGif(SDL_IOStream* src) { return checkHandle(IMG_LoadGIF_IO(src)); }
SDL_Surface* Image::loadJpg(SDL_IOStream* src) { return checkHandle(IMG_LoadJPG_IO(src)); }
SDL_Surface* Image::loadLbm(SDL_IOStream* src) { return checkHandle(IMG_LoadLBM_IO(src)); }
SDL_Surface* Image::loadPcx(SDL_IOStream* src) { return checkHandle(IMG_LoadPCX_IO(src)); }
SDL_Surface* Image::loadPng(SDL_IOStream* src) { return checkHandle(IMG_LoadPNG_IO(src)); }
SDL_Surface* Image::loadPnm(SDL_IOStream* src) { return checkHandle(IMG_LoadPNM_IO(src)); }
SDL_Surface* Image::loadSvg(SDL_IOStream* src) { return checkHandle(IMG_LoadSVG_IO(src)); }

SDL_Surface* Image::loadSvg(SDL_IOStream* src, int width, int height) {
    return checkHandle(IMG_LoadSizedSVG_IO(src, width, height));
}

SDL_Surface* Image::loadQoi(SDL_IOStream* src) { return checkHandle(IMG_LoadQOI_IO(src)); }
SDL_Surface* Image::loadTga(SDL_IOStream* src) { return checkHandle(IMG_LoadTGA_IO(src)); }
SDL_Surface* Image::loadXcf(SDL_IOStream* src) { return checkHandle(IMG_LoadXCF_IO(src)); }
SDL_Surface* Image::loadXpm(SDL_IOStream* src) { return checkHandle(IMG_LoadXPM_IO(src)); }
SDL_Surface* Image::loadXV(SDL_IOStream* src) { return checkHandle(IMG_LoadXV_IO(src)); }

SDL_Surface* Image::loadXpm(const std::vector<std::string>& lines) {
    std::vector<std::string> copies(lines);
    std::vector<char*> raw = xpmLines(copies);
    return checkHandle(IMG_ReadXPMFromArray(raw.data()));
}

SDL_Surface* Image::loadXpm32(const std::vector<std::string>& lines) {
    std::vector<std::string> copies(lines);
    std::vector<char*> raw = xpmLines(copies);
    return checkHandle(IMG_ReadXPMFromArrayToRGB888(raw.data()));
}

// ============================================================================
//                     Image: probes
// ============================================================================

bool Image::isIco(SDL_IOStream* src) { return IMG_isICO(src); }
bool Image::isCur(SDL_IOStream* src) { return IMG_isCUR(src); }
bool Image::isBmp(SDL_IOStream* src) { return IMG_isBMP(src); }
bool Image::isGif(SDL_IOStream* src) { return IMG_isGIF(src); }
bool Image::isJpg(SDL_IOStream* src) { return IMG_isJPG(src); }
bool Image::isLbm(SDL_IOStream* src) { return IMG_isLBM(src); }
bool Image::isPcx(SDL_IOStream* src) { return IMG_isPCX(src); }
bool Image::isPng(SDL_IOStream* src) { return IMG_isPNG(src); }
bool Image::isPnm(SDL_IOStream* src) { return IMG_isPNM(src); }
bool Image::isSvg(SDL_IOStream* src) { return IMG_isSVG(src); }
bool Image::isQoi(SDL_IOStream* src) { return IMG_isQOI(src); }
bool Image::isTga(SDL_IOStream* src) { return IMG_isTGA(src); }
bool Image::isXcf(SDL_IOStream* src) { return IMG_isXCF(src); }
bool Image::isXpm(SDL_IOStream* src) { return IMG_isXPM(src); }
bool Image::isXV(SDL_IOStream* src) { return IMG_isXV(src); }

// ============================================================================
//                     Image: writers
// ============================================================================

void Image::savePng(SDL_Surface* surface, const std::string& file) {
    checkSdl(IMG_SavePNG(surface, file.c_str()));
}

void Image::savePng(SDL_Surface* surface, SDL_IOStream* dst, bool closeIO) {
    checkSdl(IMG_SavePNG_IO(surface, dst, closeIO));
}

void Image::saveJpg(SDL_Surface* surface, const std::string& file, int quality) {
    checkSdl(IMG_SaveJPG(surface, file.c_str(), quality));
}

void Image::saveJpg(SDL_Surface* surface, SDL_IOStream* dst, bool closeIO, int quality) {
    checkSdl(IMG_SaveJPG_IO(surface, dst, closeIO, quality));
}

// ============================================================================
//                     AnimatedImage
// ============================================================================

AnimatedImage AnimatedImage::load(const std::string& file) {
    return AnimatedImage(checkHandle(IMG_LoadAnimation(file.c_str())));
}

AnimatedImage AnimatedImage::load(SDL_IOStream* src, bool closeIO, const std::string& type) {
    if (type.empty()) {
        return AnimatedImage(checkHandle(IMG_LoadAnimation_IO(src, closeIO)));
    }
    return AnimatedImage(checkHandle(IMG_LoadAnimationTyped_IO(src, closeIO, typeOrNull(type))));
}

AnimatedImage AnimatedImage::loadGif(SDL_IOStream* src) {
    return AnimatedImage(checkHandle(IMG_LoadGIFAnimation_IO(src)));
}

void AnimatedImage::free() {
    IMG_FreeAnimation(handle);
    handle = nullptr;
}

int AnimatedImage::width() const {
    return handle ? handle->w : 0;
}

int AnimatedImage::height() const {
    return handle ? handle->h : 0;
}

int AnimatedImage::frameCount() const {
    return handle ? handle->count : 0;
}

SDL_Surface* AnimatedImage::frame(int index) const {
    checkIndex(index);
    return handle->frames[index];
}

int AnimatedImage::delay(int index) const {
    checkIndex(index);
    return handle->delays[index];
}

void AnimatedImage::checkIndex(int index) const {
    if (index < 0 || index >= frameCount()) {
        throw UsageError("Animation frame index " + std::to_string(index) + " out of range.");
    }
}

} // namespace sdlkit
