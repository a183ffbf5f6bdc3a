#include <climits>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kValueFlags{
    "--dest",         "--token",     "--workers",      "--org",
    "--api-url",      "--retries",   "--git",          "--http-timeout",
    "--log-file",     "--log-level", "--max-log-size", "--max-log-files",
    "--config-yaml",  "--config-json"};

const std::set<std::string> kSwitchFlags{
    "--ssh",           "--include-archived", "--full",     "--mirror",   "--strict-pull",
    "--fail-on-error", "--no-progress",      "--no-colors", "--verbose", "--json-log",
    "--compress-logs", "--help",             "--version"};

const std::map<char, std::string> kShortOpts{{'h', "--help"},        {'V', "--version"},
                                             {'d', "--dest"},        {'w', "--workers"},
                                             {'l', "--log-file"},    {'L', "--log-level"},
                                             {'y', "--config-yaml"}, {'j', "--config-json"},
                                             {'C', "--no-colors"},   {'v', "--verbose"}};

std::set<std::string> known_flags() {
    std::set<std::string> known = kValueFlags;
    known.insert(kSwitchFlags.begin(), kSwitchFlags.end());
    return known;
}

void load_config_file(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                      fs::path& config_file) {
    const std::set<std::string> pre_known{"--config-yaml", "--config-json"};
    const std::map<char, std::string> pre_short{{'y', "--config-yaml"}, {'j', "--config-json"}};
    ArgParser pre_parser(argc, argv, pre_known, pre_known, pre_short);
    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
}

std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (v && *v)
        return std::string(v);
    return std::nullopt;
}

} // namespace

Options parse_options(int argc, char* argv[]) {
    const std::set<std::string> known = known_flags();
    std::map<std::string, std::string> cfg_opts;
    fs::path config_file;
    load_config_file(argc, argv, cfg_opts, config_file);

    ArgParser parser(argc, argv, known, kValueFlags, kShortOpts);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (!parser.positional().empty())
        throw std::runtime_error("Unexpected argument: " + parser.positional().front());
    for (const auto& kv : cfg_opts) {
        if (!known.count(kv.first) || kv.first == "--config-yaml" ||
            kv.first == "--config-json")
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() && parse_bool(it->second);
    };
    auto flag = [&](const std::string& k) { return parser.has_flag(k) || cfg_flag(k); };
    // Command line value first, then the config file.
    auto value_of = [&](const std::string& k) -> std::optional<std::string> {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::nullopt;
    };
    auto require_value = [&](const std::string& k) -> std::optional<std::string> {
        auto v = value_of(k);
        if (v && v->empty())
            throw std::runtime_error(k + " requires a value");
        return v;
    };

    Options opts;
    opts.config_file = config_file;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");

    if (auto v = require_value("--org"))
        opts.organization = *v;
    if (auto v = require_value("--api-url"))
        opts.api_url = *v;
    if (auto v = require_value("--dest"))
        opts.dest = *v;
    if (auto v = require_value("--git"))
        opts.git_executable = *v;

    if (auto v = value_of("--token"); v && !v->empty())
        opts.token = *v;
    else if (auto env = env_value("GITHUB_TOKEN"))
        opts.token = env;
    else
        opts.token = env_value("GH_TOKEN");

    opts.workers = default_workers();
    if (auto v = require_value("--workers")) {
        bool ok = false;
        long n = parse_long(*v, LONG_MIN, LONG_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --workers");
        opts.workers = clamp_workers(n);
    }
    if (auto v = require_value("--retries")) {
        bool ok = false;
        opts.retries = parse_int(*v, 0, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --retries");
    }
    if (auto v = require_value("--http-timeout")) {
        bool ok = false;
        int secs = parse_int(*v, 1, 3600, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --http-timeout");
        opts.http_timeout = std::chrono::seconds(secs);
    }

    opts.use_ssh = flag("--ssh");
    opts.include_archived = flag("--include-archived");
    opts.full = flag("--full");
    opts.mirror = flag("--mirror");
    opts.shallow = !opts.full && !opts.mirror;
    opts.strict_pull = flag("--strict-pull");
    opts.fail_on_error = flag("--fail-on-error");
    opts.show_progress = !flag("--no-progress");
    opts.no_colors = flag("--no-colors");

    if (flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (auto v = require_value("--log-level"))
        opts.logging.log_level = parse_log_level(*v);
    if (auto v = require_value("--log-file"))
        opts.logging.log_file = *v;
    if (auto v = require_value("--max-log-size")) {
        bool ok = false;
        opts.logging.max_log_size = parse_bytes(*v, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (auto v = require_value("--max-log-files")) {
        bool ok = false;
        opts.logging.max_log_files = parse_size_t(*v, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.compress_logs = flag("--compress-logs");
    return opts;
}

void apply_terminal_defaults(Options& opts, bool stdout_tty) {
    if (stdout_tty)
        return;
    opts.show_progress = false;
    opts.no_colors = true;
}

WorkerPoolConfig make_pool_config(const Options& opts) {
    WorkerPoolConfig cfg;
    cfg.destination_directory = fs::absolute(opts.dest);
    cfg.concurrency = clamp_workers(opts.workers);
    cfg.use_ssh = opts.use_ssh;
    cfg.mirror = opts.mirror;
    cfg.shallow = !opts.full && !opts.mirror;
    cfg.retry_limit = opts.retries;
    cfg.strict_pull = opts.strict_pull;
    cfg.git_executable = opts.git_executable;
    return cfg;
}
