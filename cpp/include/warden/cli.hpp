#pragma once

namespace warden::cli
{

    /** Parse arguments and run the selected subcommand. Returns the process exit code. */
    int run(int argc, char *argv[]);

} // namespace warden::cli
