#ifndef REPO_HPP
#define REPO_HPP
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>

/**
 * @brief Minimal identifying record for one repository of an organization.
 *
 * Created by the repository lister and only read afterwards.
 */
struct RepositoryDescriptor {
    std::string name;           ///< Unique within the organization
    std::string http_clone_url; ///< HTTPS clone URL (`clone_url`)
    std::string ssh_clone_url;  ///< SSH clone URL (`ssh_url`)
    bool archived = false;      ///< Repository is archived upstream
};

/**
 * @brief Result kind of one clone/update unit of work.
 */
enum class OutcomeKind {
    Cloned,  ///< Fresh clone succeeded
    Updated, ///< Existing checkout was updated
    Failed   ///< Nothing succeeded, see CloneOutcome::reason
};

/**
 * @brief Outcome of processing a single repository.
 */
struct CloneOutcome {
    OutcomeKind kind = OutcomeKind::Failed;
    std::string name;   ///< Repository name
    std::string reason; ///< Failure detail, empty unless kind is Failed
    std::string commit; ///< Short HEAD hash after success, if readable

    static CloneOutcome cloned(std::string name, std::string commit = {}) {
        return {OutcomeKind::Cloned, std::move(name), {}, std::move(commit)};
    }
    static CloneOutcome updated(std::string name, std::string commit = {}) {
        return {OutcomeKind::Updated, std::move(name), {}, std::move(commit)};
    }
    static CloneOutcome failed(std::string name, std::string reason) {
        return {OutcomeKind::Failed, std::move(name), std::move(reason), {}};
    }

    bool succeeded() const { return kind != OutcomeKind::Failed; }
};

/** @return "cloned", "updated" or "failed". */
const char* outcome_label(OutcomeKind kind);

/**
 * @brief Settings shared by every clone/update worker of one run.
 *
 * Built once before the pool starts. `mirror` implies `!shallow`.
 */
struct WorkerPoolConfig {
    std::filesystem::path destination_directory;
    int concurrency = 1;       ///< Worker threads, 1..16
    bool use_ssh = false;      ///< Clone with the SSH URL
    bool shallow = true;       ///< Depth 1 clone
    bool mirror = false;       ///< Bare mirror clone
    int retry_limit = 2;       ///< Additional clone attempts after the first
    bool strict_pull = false;  ///< Failed fast-forward marks the repository failed
    std::string git_executable = "git";
    std::chrono::seconds initial_backoff{5};
    std::chrono::seconds max_backoff{300}; ///< Upper bound for the doubling delay
};

constexpr int kMinWorkers = 1;
constexpr int kMaxWorkers = 16;

/** @brief Clamp a requested worker count to [kMinWorkers, kMaxWorkers]. */
int clamp_workers(long requested);

/** @brief Default worker count: min(8, hardware threads), at least 1. */
int default_workers();

/**
 * @brief Check the invariants of @p cfg.
 *
 * @throws std::invalid_argument if `mirror` and `shallow` are both set, the
 *         concurrency is outside [1,16], the retry limit is negative or the
 *         destination is empty.
 */
void validate_config(const WorkerPoolConfig& cfg);

/** @brief Local checkout path for @p repo: destination/name[.git]. */
std::filesystem::path checkout_path(const WorkerPoolConfig& cfg, const RepositoryDescriptor& repo);

#endif // REPO_HPP
