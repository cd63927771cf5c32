#include "sdlkit/Image.h"
#include "sdlkit/Error.h"

#include "doctest/doctest.h"

#include <string>
#include <vector>

namespace sdlkit {

TEST_CASE("SDL3_image version") {
    CHECK(SDL_VERSIONNUM_MAJOR(Image::version()) == SDL_IMAGE_MAJOR_VERSION);
}

TEST_CASE("PNG written to memory reads back") {
    SDL_Surface* source = SDL_CreateSurface(8, 4, SDL_PIXELFORMAT_RGBA32);
    REQUIRE(source);
    REQUIRE(SDL_FillSurfaceRect(source, nullptr, SDL_MapSurfaceRGBA(source, 200, 40, 10, 255)));

    SDL_IOStream* stream = SDL_IOFromDynamicMem();
    REQUIRE(stream);
    Image::savePng(source, stream, false);
    REQUIRE(SDL_SeekIO(stream, 0, SDL_IO_SEEK_SET) == 0);

    CHECK(Image::isPng(stream));
    CHECK_FALSE(Image::isBmp(stream));
    CHECK_FALSE(Image::isGif(stream));

    SDL_Surface* loaded = Image::load(stream, false, "PNG");
    REQUIRE(loaded);
    CHECK(loaded->w == 8);
    CHECK(loaded->h == 4);

    Uint8 r = 0, g = 0, b = 0, a = 0;
    REQUIRE(SDL_ReadSurfacePixel(loaded, 3, 2, &r, &g, &b, &a));
    CHECK(r == 200);
    CHECK(g == 40);
    CHECK(b == 10);

    SDL_DestroySurface(loaded);
    SDL_DestroySurface(source);
    SDL_CloseIO(stream);
}

TEST_CASE("XPM from memory") {
    const std::vector<std::string> xpm = {
        "4 2 2 1",
        ". c #FF0000",
        "# c #0000FF",
        "..##",
        "##.."
    };

    SDL_Surface* surface = Image::loadXpm(xpm);
    REQUIRE(surface);
    CHECK(surface->w == 4);
    CHECK(surface->h == 2);
    SDL_DestroySurface(surface);

    SDL_Surface* rgb = Image::loadXpm32(xpm);
    REQUIRE(rgb);
    CHECK(rgb->format == SDL_PIXELFORMAT_XRGB8888);
    SDL_DestroySurface(rgb);
}

TEST_CASE("image load failures") {
    CHECK_THROWS_AS(Image::load("/nonexistent/picture.png"), Error);
    CHECK_THROWS_AS(AnimatedImage::load("/nonexistent/animation.gif"), Error);

    AnimatedImage none;
    CHECK(none == nullptr);
    CHECK(none.frameCount() == 0);
    CHECK_THROWS_AS(none.frame(0), UsageError);
    CHECK_THROWS_AS(none.delay(-1), UsageError);
}

} // namespace sdlkit
