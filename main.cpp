// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file main.cpp
 * @brief Hosted entry point for ux8 v0.1.
 */

#include "ux8.hpp"
#include <cstdio>
#include <string_view>

namespace {

void print_usage(const char* argv0) {
    std::printf("usage: %s [--pal | --ntsc] [--trace] [--help]\n"
                "  --pal    50 Hz jiffy clock\n"
                "  --ntsc   60 Hz jiffy clock (default)\n"
                "  --trace  record shell events and dump them on exit\n",
                argv0);
}

} // namespace

int main(int argc, char** argv) {
    ux8::BootOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--pal") {
            options.ticks_per_second = ux8::core::PAL_TICKS_PER_SEC;
        } else if (arg == "--ntsc") {
            options.ticks_per_second = ux8::core::DEFAULT_TICKS_PER_SEC;
        } else if (arg == "--trace") {
            options.trace = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::fprintf(stderr, "%s: unknown option '%s'\n", argv[0], argv[i]);
            print_usage(argv[0]);
            return 2;
        }
    }

    ux8::g_platform = ux8::hal::get_platform();
    return ux8::shell_main(options);
}
