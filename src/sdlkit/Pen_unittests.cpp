#include "sdlkit/Pen.h"
#include "sdlkit/Error.h"

#include "doctest/doctest.h"

#include <string>

namespace sdlkit {

TEST_CASE("pen input flags") {
    PenInputFlags none;
    CHECK_FALSE(none.isDown());
    CHECK_FALSE(none.isEraserTip());

    PenInputFlags flags(SDL_PEN_INPUT_DOWN | SDL_PEN_INPUT_BUTTON_2 | SDL_PEN_INPUT_BUTTON_5);
    CHECK(flags.isDown());
    CHECK_FALSE(flags.isEraserTip());
    CHECK_FALSE(flags.button(1));
    CHECK(flags.button(2));
    CHECK(flags.button(5));
    CHECK_THROWS_AS(flags.button(0), UsageError);
    CHECK_THROWS_AS(flags.button(6), UsageError);

    CHECK(PenInputFlags(SDL_PEN_INPUT_ERASER_TIP).isEraserTip());
    CHECK(flags != none);
}

TEST_CASE("pen axes and pseudo devices") {
    CHECK(std::string(penAxisName(PenAxis::PRESSURE)) == "pressure");
    CHECK(std::string(penAxisName(PenAxis::TANGENTIAL_PRESSURE)) == "tangential_pressure");
    CHECK(Pen::mouse() == SDL_PEN_MOUSEID);
    CHECK(Pen::touch() == SDL_PEN_TOUCHID);
}

} // namespace sdlkit
