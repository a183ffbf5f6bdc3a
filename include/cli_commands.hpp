#pragma once

#include <filesystem>
#include <ostream>
#include <vector>

#include "clone_worker.hpp"
#include "github_client.hpp"
#include "options.hpp"
#include "repo.hpp"

namespace cli {

struct PipelineResult {
    int exit_code = 0;
    std::vector<CloneOutcome> outcomes;  ///< Completion order
    std::filesystem::path summary_log;   ///< Empty when no log was written
};

/**
 * @brief List, clone/update and summarize one organization.
 *
 * Creates the destination directory, lists the organization through @p http,
 * runs the worker pool with @p hooks (their output sink is replaced by the
 * progress bar) and writes the summary log. Listing failures are reported on
 * @p err and yield exit code 2.
 *
 * @throws std::runtime_error if the summary log cannot be written.
 * @throws std::filesystem::filesystem_error if the destination cannot be
 *         created.
 */
PipelineResult run_pipeline(const Options& opts, HttpClient& http, CloneHooks hooks,
                            std::ostream& out, std::ostream& err);

/**
 * @brief Production entry for a clone run using libcurl and the git binary.
 *
 * @return Process exit code.
 */
int handle_clone_run(const Options& opts);

} // namespace cli
