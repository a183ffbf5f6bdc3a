#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP
#include <functional>
#include <vector>

#include "clone_worker.hpp"
#include "repo.hpp"

using WorkFn = std::function<CloneOutcome(const RepositoryDescriptor&)>;
using DoneFn = std::function<void(const CloneOutcome&)>;

/**
 * @brief Run @p work once for every descriptor on a fixed pool of threads.
 *
 * Up to @p concurrency threads (never more than there are descriptors) pull
 * the next unclaimed descriptor from a shared index until none remain.
 * Outcomes are returned in completion order. @p on_done, if set, is invoked
 * once per finished unit from the worker thread that finished it. A unit
 * whose @p work throws is recorded as failed with the exception text; the
 * other units are unaffected.
 */
std::vector<CloneOutcome> run_pool(const std::vector<RepositoryDescriptor>& descriptors,
                                   int concurrency, const WorkFn& work,
                                   const DoneFn& on_done = {});

/**
 * @brief Clone or update every descriptor with process_one().
 *
 * @throws std::invalid_argument when @p cfg is invalid.
 */
std::vector<CloneOutcome> run_clone_pool(const std::vector<RepositoryDescriptor>& descriptors,
                                         const WorkerPoolConfig& cfg, const CloneHooks& hooks,
                                         const DoneFn& on_done = {});

#endif // WORKER_POOL_HPP
