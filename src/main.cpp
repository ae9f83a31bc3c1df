#include "Engine.hpp"
#include <cstdio>

int main(int argc, char** argv) {
    const char* configPath = argc > 1 ? argv[1] : "skyline.json";

    skyline::Engine engine;
    if (!engine.initialize(1280, 720, "Skyline", configPath)) {
        std::fprintf(stderr, "Failed to initialize engine\n");
        return 1;
    }
    engine.run();
    engine.shutdown();
    return 0;
}
