#include "summary.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

Summary summarize(const std::vector<CloneOutcome>& outcomes) {
    Summary s;
    s.total = outcomes.size();
    for (const auto& o : outcomes) {
        if (o.succeeded())
            ++s.success_count;
        else
            s.failures.push_back(o);
    }
    return s;
}

std::string format_outcome(const CloneOutcome& outcome) {
    std::string line = std::string(outcome_label(outcome.kind)) + ": " + outcome.name;
    if (outcome.kind == OutcomeKind::Failed && !outcome.reason.empty())
        line += " (" + outcome.reason + ")";
    return line;
}

std::filesystem::path write_summary_log(const std::filesystem::path& dest,
                                        const std::vector<CloneOutcome>& outcomes,
                                        std::time_t unix_ts) {
    std::filesystem::path path =
        dest / ("clone_summary_" + std::to_string(static_cast<long long>(unix_ts)) + ".log");
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
        throw std::runtime_error("Failed to open summary log " + path.string() + ": " +
                                 std::strerror(errno));
    for (const auto& o : outcomes)
        ofs << format_outcome(o) << '\n';
    ofs.flush();
    if (!ofs)
        throw std::runtime_error("Failed to write summary log " + path.string());
    return path;
}

void print_summary(std::ostream& os, const Summary& summary, const TuiColors& colors) {
    const std::string& count_color = summary.failures.empty() ? colors.green : colors.yellow;
    os << "\n" << colors.bold << "Summary:" << colors.reset << "\n";
    os << "  Success: " << count_color << summary.success_count << "/" << summary.total
       << colors.reset << "\n";
    if (!summary.failures.empty()) {
        os << "  Failures:\n";
        for (const auto& f : summary.failures)
            os << "    - " << colors.red << format_outcome(f) << colors.reset << "\n";
    }
}
