/**
 * @file    cli_app.hpp
 * @brief   Headless command-line front end
 * @license MIT
 *
 * @details
 * Subcommands:
 *   list <dir>           Images with their annotation counts
 *   labels               Unique labels found in the output directory
 *   upgrade <json>...    Rewrite legacy annotation files in the canonical schema
 *   render <image>       Viewport + overlay rendered to an image file
 */

#pragma once

namespace bba::cli {

/**
 * Parse arguments and run the selected subcommand
 * @return Process exit code (0 on success, 1 on any failure)
 */
int run(int argc, char** argv);

}  // namespace bba::cli
