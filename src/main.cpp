// main.cpp - lyricglow entry point
// Lyrics on a glowing stage, pulsing with the music.

#include "core/Application.hpp"
#include "core/Logger.hpp"

#include <iostream>
#include <string_view>

namespace {

int fail(std::string_view stage, const std::string& message) {
    std::cerr << stage << ": " << message << "\n";
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        lg::Application app(argc, argv);

        auto opts = app.parseArgs();
        if (!opts)
            return fail("Error",
                        opts.error().message +
                                "\nTry --help for usage information.");

        if (auto res = app.init(*opts); !res) {
            LOG_CRITICAL("Startup aborted: {}", res.error().message);
            return fail("Initialization failed", res.error().message);
        }

        return app.exec();
    } catch (const std::exception& e) {
        return fail("Fatal error", e.what());
    }
}
