#include "help_text.hpp"
#include <algorithm>
#include <iomanip>
#include <vector>
#include <map>
#include <cstring>
#include <string>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(std::ostream& os, const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--org", "", "<name>", "Organization to clone (default: electronicarts)", "Basics"},
        {"--dest", "-d", "<path>", "Destination folder for all repos (default: electronicarts)",
         "Basics"},
        {"--token", "", "<token>", "API token (env: GITHUB_TOKEN or GH_TOKEN)", "Basics"},
        {"--include-archived", "", "", "Include archived repositories", "Basics"},
        {"--api-url", "", "<url>", "API base URL (default: https://api.github.com)", "Basics"},
        {"--http-timeout", "", "<sec>", "Timeout per listing request (default: 60)", "Basics"},
        {"--ssh", "", "", "Use SSH URLs instead of HTTPS", "Clone"},
        {"--full", "", "", "Full clone instead of shallow depth=1", "Clone"},
        {"--mirror", "", "", "Bare mirror clone (implies full clone)", "Clone"},
        {"--retries", "", "<n>", "Extra clone attempts after a failure (default: 2)", "Clone"},
        {"--strict-pull", "", "", "Treat a failed fast-forward pull as a failure", "Clone"},
        {"--git", "", "<path>", "Git executable to run (default: git)", "Clone"},
        {"--workers", "-w", "<n>", "Concurrent clones, 1-16 (default: up to 8)", "Concurrency"},
        {"--no-progress", "", "", "Disable progress bars", "Display"},
        {"--no-colors", "-C", "", "Disable ANSI colors", "Display"},
        {"--fail-on-error", "", "", "Exit with status 1 if any repository failed", "Process"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "Write application log to file", "Logging"},
        {"--log-level", "-L", "<lvl>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-v", "", "Same as --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate log file at this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default: 1)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "orgclone - Clone or update every repository of an organization\n";
    os << "Existing checkouts are updated, new ones are cloned in parallel.\n";
    os << "Configuration can be read from YAML or JSON files.\n\n";
    os << "Usage: " << prog << " [options]\n\n";
    const std::vector<std::string> order{"Basics",      "Clone",   "Concurrency", "Display",
                                         "Process",     "Config",  "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o) << o->desc
               << "\n";
        os << "\n";
    }
}
