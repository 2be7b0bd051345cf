#pragma once

// Parse the command line, build the requested archive and return the process exit code:
// 0 on success or when only usage was printed, 1 for an invalid format or bad options,
// 2 when archiving failed.
int run_cli(int argc, char* argv[]);
