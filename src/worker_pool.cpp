#include "worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>

#include "logger.hpp"
#include "thread_utils.hpp"

std::vector<CloneOutcome> run_pool(const std::vector<RepositoryDescriptor>& descriptors,
                                   int concurrency, const WorkFn& work, const DoneFn& on_done) {
    std::vector<CloneOutcome> results;
    if (descriptors.empty())
        return results;
    results.reserve(descriptors.size());

    size_t threads = static_cast<size_t>(clamp_workers(concurrency));
    threads = std::min(threads, descriptors.size());
    log_debug("Starting worker pool", {{"threads", std::to_string(threads)},
                                       {"repositories", std::to_string(descriptors.size())}});

    std::atomic<size_t> next_index{0};
    std::mutex results_mtx;
    auto worker = [&]() {
        while (true) {
            size_t idx = next_index.fetch_add(1);
            if (idx >= descriptors.size())
                break;
            const auto& repo = descriptors[idx];
            CloneOutcome outcome;
            try {
                outcome = work(repo);
            } catch (const std::exception& e) {
                log_error("Worker failed", {{"repo", repo.name}, {"error", e.what()}});
                outcome = CloneOutcome::failed(repo.name, e.what());
            } catch (...) {
                log_error("Worker failed with unknown exception", {{"repo", repo.name}});
                outcome = CloneOutcome::failed(repo.name, "unknown error");
            }
            {
                std::lock_guard<std::mutex> lk(results_mtx);
                results.push_back(outcome);
            }
            if (on_done)
                on_done(outcome);
        }
    };

    {
        ThreadGroup group;
        for (size_t i = 0; i < threads; ++i)
            group.spawn(worker);
    }
    return results;
}

std::vector<CloneOutcome> run_clone_pool(const std::vector<RepositoryDescriptor>& descriptors,
                                         const WorkerPoolConfig& cfg, const CloneHooks& hooks,
                                         const DoneFn& on_done) {
    validate_config(cfg);
    return run_pool(
        descriptors, cfg.concurrency,
        [&cfg, &hooks](const RepositoryDescriptor& repo) { return process_one(repo, cfg, hooks); },
        on_done);
}
