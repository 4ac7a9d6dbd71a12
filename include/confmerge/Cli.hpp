/**
 * @file Cli.hpp
 * @brief Command-line front end of confmerge
 */

#ifndef CONFMERGE_CLI_HPP
#define CONFMERGE_CLI_HPP

#include <iosfwd>

namespace confmerge {

/// Exit status of run_cli()
enum ExitCode {
    kExitOk = 0,
    kExitError = 1,
    kExitUsage = 2
};

/**
 * @brief Run the confmerge command line
 *
 * Merged output and --help / --explain text go to `out`, error
 * messages ("Error: ...") to `err`.
 *
 * @return kExitOk on success, kExitError for merge, load, options or
 *         write failures, kExitUsage for bad flags or missing sources
 */
int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace confmerge

#endif // CONFMERGE_CLI_HPP
