/**
 * @file    main.cpp
 * @brief   bbox-annotator entry point
 * @license MIT
 *
 * @details
 * Routes to the GUI or the CLI.
 *
 * Launch modes:
 *   - No arguments:           GUI (if built in), otherwise CLI help
 *   - --gui or -g [path]:     GUI, optionally opening an image or directory
 *   - <subcommand> ...:       CLI
 */

#include "cli/cli_app.hpp"

#if defined(BBA_HAS_GUI)
#include "gui/gui_app.hpp"
#endif

#include <string_view>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace {

constexpr std::string_view kGuiFlag = "--gui";
constexpr std::string_view kGuiShortFlag = "-g";

[[nodiscard]] bool is_gui_flag(std::string_view arg) noexcept {
    return arg == kGuiFlag || arg == kGuiShortFlag;
}

// UTF-8 output and ANSI colors on the Windows console
void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE out = GetStdHandle(STD_OUTPUT_HANDLE);
    if (out != INVALID_HANDLE_VALUE) {
        DWORD mode = 0;
        if (GetConsoleMode(out, &mode)) {
            SetConsoleMode(out, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
        }
    }
#endif
}

[[nodiscard]] bool should_launch_gui([[maybe_unused]] int argc,
                                     [[maybe_unused]] char** argv) {
#if defined(BBA_HAS_GUI)
    if (argc == 1) {
        return true;
    }
    for (int i = 1; i < argc; ++i) {
        if (is_gui_flag(argv[i])) {
            return true;
        }
    }
#endif
    return false;
}

/**
 * Drop --gui/-g so the remaining arguments parse cleanly
 */
void strip_gui_flags(int& argc, char** argv) {
    int out = 1;
    for (int in = 1; in < argc; ++in) {
        if (!is_gui_flag(argv[in])) {
            argv[out++] = argv[in];
        }
    }
    argc = out;
}

}  // anonymous namespace

int main(int argc, char** argv) {
    setup_console();

    const bool gui = should_launch_gui(argc, argv);
    strip_gui_flags(argc, argv);

#if defined(BBA_HAS_GUI)
    if (gui) {
        return bba::gui::run(argc, argv);
    }
#else
    (void)gui;
#endif

    return bba::cli::run(argc, argv);
}
