#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "logger.hpp"
#include "repo.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
};

struct Options {
    std::string organization = "electronicarts";
    std::string api_url = "https://api.github.com";
    std::filesystem::path dest = "electronicarts";
    std::optional<std::string> token;
    bool use_ssh = false;
    bool include_archived = false;
    int workers = 1;
    bool full = false;
    bool mirror = false;
    bool shallow = true; ///< Derived: neither --full nor --mirror
    int retries = 2;
    std::string git_executable = "git";
    bool strict_pull = false;
    bool fail_on_error = false;
    std::chrono::seconds http_timeout{60};
    bool show_progress = true;
    bool no_colors = false;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool show_help = false;
    bool print_version = false;
};

/**
 * Parse command-line arguments and configuration files to populate an Options
 * instance.
 *
 * Options given on the command line override values from `--config-yaml` or
 * `--config-json`. The token falls back to the `GITHUB_TOKEN` and then the
 * `GH_TOKEN` environment variables. `--workers` is clamped to [1,16].
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error for unknown options, missing or malformed
 *         values and unreadable configuration files.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Turn off progress bars and colors when standard output is not a terminal.
 */
void apply_terminal_defaults(Options& opts, bool stdout_tty);

/**
 * Build the worker pool configuration for a run.
 *
 * The destination is made absolute.
 */
WorkerPoolConfig make_pool_config(const Options& opts);

#endif // OPTIONS_HPP
