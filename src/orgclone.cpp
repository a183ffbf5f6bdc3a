/**
 * @file orgclone.cpp
 * @brief CLI entry point cloning or updating every repository of an
 *        organization.
 *
 * Initializes libgit2 and libcurl, parses options, configures the file logger
 * and hands over to the clone pipeline.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "github_client.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "tui.hpp"
#include "version.hpp"

namespace {

void start_logging(const LoggingOptions& logging) {
    if (logging.log_file.empty())
        return;
    init_logger(logging.log_file, logging.log_level, logging.max_log_size, logging.max_log_files);
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
}

} // namespace

/**
 * @brief Application entry point.
 *
 * @return 0 on success or when printing help/version, 2 when the repository
 *         list cannot be fetched, 1 on invalid options or unexpected errors.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    CurlGlobalGuard curl_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(std::cout, argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << ORGCLONE_VERSION << "\n";
            return 0;
        }
        apply_terminal_defaults(opts, stdout_is_terminal());
        start_logging(opts.logging);
        int rc = cli::handle_clone_run(opts);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        log_error(e.what());
        shutdown_logger();
        std::cerr << e.what() << "\n";
        return 1;
    }
}
