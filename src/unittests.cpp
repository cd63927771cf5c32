#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "sdlkit/Log.h"

int main(int argc, char* argv[]) {
    sdlkit::log::setPriority(sdlkit::log::Priority::DEBUG);
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    int res = context.run();
    return res;
}
