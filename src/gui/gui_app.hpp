/**
 * @file    gui_app.hpp
 * @brief   GUI Application Entry Point
 * @license MIT
 */

#pragma once

namespace bba::gui {

/**
 * Run the annotation GUI until the window closes.
 * A positional argument naming an image or directory is opened at startup.
 *
 * @return Process exit code
 */
int run(int argc, char** argv);

}  // namespace bba::gui
