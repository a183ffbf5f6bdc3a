#include <filesystem>
#include <iostream>
#include <optional>

#include "cli_commands.hpp"
#include "logger.hpp"
#include "summary.hpp"
#include "time_utils.hpp"
#include "tui.hpp"
#include "worker_pool.hpp"

namespace fs = std::filesystem;

namespace cli {

PipelineResult run_pipeline(const Options& opts, HttpClient& http, CloneHooks hooks,
                            std::ostream& out, std::ostream& err) {
    PipelineResult result;
    const TuiColors colors = make_tui_colors(opts.no_colors);
    const WorkerPoolConfig cfg = make_pool_config(opts);
    validate_config(cfg);
    fs::create_directories(cfg.destination_directory);
    log_info("Starting run", {{"org", opts.organization},
                              {"dest", cfg.destination_directory.string()},
                              {"workers", std::to_string(cfg.concurrency)}});

    std::vector<RepositoryDescriptor> repos;
    {
        ProgressBar bar(out, "Listing repositories from GitHub", std::nullopt, "page",
                        opts.show_progress, colors);
        RepositoryLister lister(http, opts.organization, opts.api_url);
        lister.on_page([&bar](int, size_t) { bar.advance(); });
        lister.on_notice([&bar](const std::string& msg) { bar.write_line(msg); });
        try {
            repos = lister.list_repositories(opts.token, opts.include_archived);
        } catch (const std::exception& e) {
            bar.close();
            log_error("Listing repositories failed", {{"error", e.what()}});
            err << colors.red << "Error fetching repositories list: " << e.what() << colors.reset
                << "\n";
            result.exit_code = 2;
            return result;
        }
    }

    if (repos.empty()) {
        out << "No repositories found. (Maybe the org is empty or your token lacks access?)\n";
        return result;
    }
    out << "Found " << repos.size() << " repositories to process (dest: "
        << cfg.destination_directory.string() << ")\n";

    {
        ProgressBar bar(out, "Cloning repositories", repos.size(), "repo", opts.show_progress,
                        colors);
        hooks.output = [&bar](const std::string& line) { bar.write_line(line); };
        result.outcomes =
            run_clone_pool(repos, cfg, hooks, [&bar](const CloneOutcome&) { bar.advance(); });
    }

    Summary summary = summarize(result.outcomes);
    print_summary(out, summary, colors);
    result.summary_log =
        write_summary_log(cfg.destination_directory, result.outcomes, unix_timestamp());
    out << "\nDetailed log saved to: " << result.summary_log.string() << "\n";
    log_info("Run finished", {{"success", std::to_string(summary.success_count)},
                              {"failed", std::to_string(summary.failures.size())},
                              {"summary", result.summary_log.string()}});
    if (opts.fail_on_error && !summary.failures.empty())
        result.exit_code = 1;
    return result;
}

int handle_clone_run(const Options& opts) {
    CurlHttpClient http(opts.http_timeout);
    PipelineResult res = run_pipeline(opts, http, default_clone_hooks({}), std::cout, std::cerr);
    return res.exit_code;
}

} // namespace cli
