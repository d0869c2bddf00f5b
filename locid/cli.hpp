#ifndef LOCID_CLI
#define LOCID_CLI
#include <ostream>

/**
 * Parse the next_id command line and run it. The identifier and --help go to
 * out; the empty-corpus diagnostic and option errors go to diag. Returns the
 * process exit code: 0 for every scan outcome, 1 for bad options.
 */
int run_next_id(int argc, char** argv, std::ostream& out, std::ostream& diag);

#endif
