#ifndef CLONE_WORKER_HPP
#define CLONE_WORKER_HPP
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "repo.hpp"
#include "system_utils.hpp"

/**
 * @brief External collaborators of the clone/update worker.
 *
 * Production code uses default_clone_hooks(); tests substitute a scripted
 * command runner and a recording sleeper.
 */
struct CloneHooks {
    using CommandRunner = std::function<procutil::CommandResult(
        const std::vector<std::string>&, const std::filesystem::path&, const procutil::LineSink&)>;
    using Sleeper = std::function<void(std::chrono::seconds)>;
    using RepoProbe = std::function<bool(const std::filesystem::path&)>;
    using HeadReader = std::function<std::string(const std::filesystem::path&)>;

    CommandRunner run;
    Sleeper sleep;
    procutil::LineSink output; ///< Coordinated console output
    RepoProbe is_repository;   ///< Optional, enables the "not a repository" warning
    HeadReader read_head;      ///< Optional, fills CloneOutcome::commit
};

/**
 * @brief Hooks backed by fork/exec, std::this_thread::sleep_for and libgit2.
 *
 * @param output Receives child output and retry notices.
 */
CloneHooks default_clone_hooks(procutil::LineSink output);

/** @brief `git clone` argument vector for @p repo. */
std::vector<std::string> clone_command(const WorkerPoolConfig& cfg, const RepositoryDescriptor& repo);

/**
 * @brief Update commands for an existing checkout, run in order.
 *
 * Mirrors get a single `remote update --prune`. Working trees get
 * `fetch --all --prune` followed by `pull --ff-only`.
 */
std::vector<std::vector<std::string>> update_commands(const WorkerPoolConfig& cfg);

/**
 * @brief Clone or update one repository.
 *
 * An existing target is updated first; if the update cannot run or fails the
 * worker falls back to a fresh clone, retried up to `cfg.retry_limit` extra
 * times with doubling backoff. Never throws for per-repository problems.
 */
CloneOutcome process_one(const RepositoryDescriptor& repo, const WorkerPoolConfig& cfg,
                         const CloneHooks& hooks);

#endif // CLONE_WORKER_HPP
