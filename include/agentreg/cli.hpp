#pragma once

namespace agentreg::cli
{
    /** Entry point of the agentreg command line tool; returns the exit code */
    int run(int argc, char *argv[]);

} // namespace agentreg::cli
