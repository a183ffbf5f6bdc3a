#include "repo.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

const char* outcome_label(OutcomeKind kind) {
    switch (kind) {
    case OutcomeKind::Cloned:
        return "cloned";
    case OutcomeKind::Updated:
        return "updated";
    case OutcomeKind::Failed:
        return "failed";
    }
    return "failed";
}

int clamp_workers(long requested) {
    return static_cast<int>(
        std::max<long>(kMinWorkers, std::min<long>(requested, kMaxWorkers)));
}

int default_workers() {
    unsigned int hw = std::thread::hardware_concurrency();
    if (hw == 0)
        hw = 4;
    return clamp_workers(std::min(8u, hw));
}

void validate_config(const WorkerPoolConfig& cfg) {
    if (cfg.mirror && cfg.shallow)
        throw std::invalid_argument("mirror clones cannot be shallow");
    if (cfg.concurrency < kMinWorkers || cfg.concurrency > kMaxWorkers)
        throw std::invalid_argument("concurrency must be between 1 and 16");
    if (cfg.retry_limit < 0)
        throw std::invalid_argument("retry limit must not be negative");
    if (cfg.destination_directory.empty())
        throw std::invalid_argument("destination directory is empty");
    if (cfg.git_executable.empty())
        throw std::invalid_argument("git executable is empty");
}

std::filesystem::path checkout_path(const WorkerPoolConfig& cfg,
                                    const RepositoryDescriptor& repo) {
    return cfg.destination_directory / (repo.name + (cfg.mirror ? ".git" : ""));
}
