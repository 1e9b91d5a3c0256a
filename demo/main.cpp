#include <cstdlib>

#include "engine/core/App.hpp"

int main(int argc, char** argv)
{
    engine::core::App app;
    return app.Run(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE;
}
