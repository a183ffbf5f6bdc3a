#include "clone_worker.hpp"

#include <algorithm>
#include <system_error>
#include <thread>
#include <utility>

#include "git_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string describe_failure(const procutil::CommandResult& res) {
    if (!res.started)
        return "failed to start git: " + res.error;
    return "exit code " + std::to_string(res.exit_code);
}

std::string head_of(const CloneHooks& hooks, const fs::path& target) {
    return hooks.read_head ? hooks.read_head(target) : std::string();
}

} // namespace

CloneHooks default_clone_hooks(procutil::LineSink output) {
    CloneHooks hooks;
    hooks.run = procutil::run_command;
    hooks.sleep = [](std::chrono::seconds s) { std::this_thread::sleep_for(s); };
    hooks.output = std::move(output);
    hooks.is_repository = [](const fs::path& p) { return git::is_git_repo(p); };
    hooks.read_head = [](const fs::path& p) { return git::short_head(p); };
    return hooks;
}

std::vector<std::string> clone_command(const WorkerPoolConfig& cfg,
                                       const RepositoryDescriptor& repo) {
    std::vector<std::string> cmd{cfg.git_executable, "clone"};
    if (cfg.mirror) {
        cmd.push_back("--mirror");
    } else if (cfg.shallow) {
        cmd.insert(cmd.end(), {"--depth", "1", "--no-single-branch"});
    }
    cmd.push_back(cfg.use_ssh ? repo.ssh_clone_url : repo.http_clone_url);
    cmd.push_back(checkout_path(cfg, repo).string());
    return cmd;
}

std::vector<std::vector<std::string>> update_commands(const WorkerPoolConfig& cfg) {
    if (cfg.mirror)
        return {{cfg.git_executable, "remote", "update", "--prune"}};
    return {{cfg.git_executable, "fetch", "--all", "--prune"},
            {cfg.git_executable, "pull", "--ff-only"}};
}

CloneOutcome process_one(const RepositoryDescriptor& repo, const WorkerPoolConfig& cfg,
                         const CloneHooks& hooks) {
    const fs::path target = checkout_path(cfg, repo);
    const procutil::LineSink sink = [&hooks](const std::string& line) {
        if (hooks.output && !is_blank(line))
            hooks.output(line);
    };

    std::error_code ec;
    if (fs::exists(target, ec)) {
        if (hooks.is_repository && !hooks.is_repository(target))
            log_warning("Existing checkout is not a git repository",
                        {{"repo", repo.name}, {"path", target.string()}});
        const auto cmds = update_commands(cfg);
        procutil::CommandResult res = hooks.run(cmds.front(), target, sink);
        if (res.ok() && cmds.size() > 1) {
            procutil::CommandResult pull = hooks.run(cmds[1], target, sink);
            if (!pull.started) {
                res = pull;
            } else if (!pull.ok()) {
                log_warning("Fast-forward pull failed",
                            {{"repo", repo.name}, {"reason", describe_failure(pull)}});
                if (cfg.strict_pull)
                    return CloneOutcome::failed(repo.name, "fast-forward pull failed (exit " +
                                                               std::to_string(pull.exit_code) +
                                                               ")");
            }
        }
        if (res.ok()) {
            log_info("Updated repository", {{"repo", repo.name}});
            return CloneOutcome::updated(repo.name, head_of(hooks, target));
        }
        log_warning("Update failed, falling back to a fresh clone",
                    {{"repo", repo.name}, {"reason", describe_failure(res)}});
    }

    const auto cmd = clone_command(cfg, repo);
    std::chrono::seconds delay = std::min(cfg.initial_backoff, cfg.max_backoff);
    procutil::CommandResult res;
    for (int attempt = 0; attempt <= cfg.retry_limit; ++attempt) {
        res = hooks.run(cmd, fs::path(), sink);
        if (res.ok()) {
            log_info("Cloned repository", {{"repo", repo.name}});
            return CloneOutcome::cloned(repo.name, head_of(hooks, target));
        }
        if (attempt == cfg.retry_limit)
            break;
        std::string notice = "[" + repo.name + "] clone ";
        notice += res.started ? "failed with exit code " + std::to_string(res.exit_code)
                              : describe_failure(res);
        notice += ". Retrying in " + std::to_string(delay.count()) + "s (attempt " +
                  std::to_string(attempt + 1) + "/" + std::to_string(cfg.retry_limit) + ")...";
        if (hooks.output)
            hooks.output(notice);
        log_warning("Clone attempt failed", {{"repo", repo.name},
                                             {"attempt", std::to_string(attempt + 1)},
                                             {"reason", describe_failure(res)}});
        if (hooks.sleep)
            hooks.sleep(delay);
        delay = std::min(delay * 2, cfg.max_backoff);
    }
    log_error("Clone failed", {{"repo", repo.name}, {"reason", describe_failure(res)}});
    return CloneOutcome::failed(repo.name, describe_failure(res));
}
