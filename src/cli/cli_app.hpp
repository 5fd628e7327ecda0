/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @license MIT
 */

#pragma once

namespace ccg::cli {

/**
 * Exit codes
 */
inline constexpr int kExitOk = 0;            // Every creative compliant
inline constexpr int kExitFailure = 1;       // Fatal error, or any creative non-compliant/failed
inline constexpr int kExitBlocked = 2;       // Campaign message blocked by legal screening

/**
 * Run the CLI application
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (see kExit*)
 */
int run(int argc, char** argv);

}  // namespace ccg::cli
