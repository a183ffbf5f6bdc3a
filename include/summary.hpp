#ifndef SUMMARY_HPP
#define SUMMARY_HPP
#include <ctime>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "repo.hpp"
#include "tui.hpp"

/**
 * @brief Aggregated view of a finished run.
 */
struct Summary {
    size_t total = 0;
    size_t success_count = 0;
    std::vector<CloneOutcome> failures; ///< In the order they completed
};

Summary summarize(const std::vector<CloneOutcome>& outcomes);

/**
 * @brief One summary line: `cloned: name`, `updated: name` or
 *        `failed: name (reason)`.
 */
std::string format_outcome(const CloneOutcome& outcome);

/**
 * @brief Write `clone_summary_<unix_ts>.log` into @p dest, one line per outcome.
 *
 * @return Path of the written file.
 * @throws std::runtime_error if the file cannot be created or written.
 */
std::filesystem::path write_summary_log(const std::filesystem::path& dest,
                                        const std::vector<CloneOutcome>& outcomes,
                                        std::time_t unix_ts);

/** @brief Print the human readable summary block. */
void print_summary(std::ostream& os, const Summary& summary, const TuiColors& colors = {});

#endif // SUMMARY_HPP
