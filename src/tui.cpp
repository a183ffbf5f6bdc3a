#include "tui.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>
#include <unistd.h>
#include <utility>
#include "time_utils.hpp"

namespace {
constexpr size_t kBarWidth = 30;
constexpr const char* kClearLine = "\r\033[2K";
} // namespace

/**
 * @brief Build the ANSI color palette.
 *
 * @param no_colors When true, all color codes are suppressed.
 */
TuiColors make_tui_colors(bool no_colors) {
    if (no_colors)
        return {};
    return {"\033[0m", "\033[32m", "\033[33m", "\033[31m", "\033[36m", "\033[1m"};
}

bool stdout_is_terminal() { return isatty(fileno(stdout)) != 0; }

ProgressBar::ProgressBar(std::ostream& out, std::string description, std::optional<size_t> total,
                         std::string unit, bool enabled, TuiColors colors)
    : out_(out), description_(std::move(description)), total_(total), unit_(std::move(unit)),
      enabled_(enabled), colors_(std::move(colors)), start_(std::chrono::steady_clock::now()) {
    std::lock_guard<std::mutex> lk(mtx_);
    draw_locked();
}

ProgressBar::~ProgressBar() { close(); }

/**
 * @brief Format the bar line.
 *
 * Known total: `desc:  40% |############                  | 4/10 repo [3s]`.
 * Unknown total: `desc: 4 page [3s]`.
 */
std::string ProgressBar::render() const {
    const size_t n = count_.load();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_);
    std::ostringstream ss;
    ss << description_ << ": ";
    if (total_ && *total_ > 0) {
        const size_t done = std::min(n, *total_);
        const size_t pct = done * 100 / *total_;
        const size_t filled = done * kBarWidth / *total_;
        ss << (pct < 10 ? "  " : pct < 100 ? " " : "") << pct << "% |" << std::string(filled, '#')
           << std::string(kBarWidth - filled, ' ') << "| " << n << "/" << *total_ << " " << unit_;
    } else {
        ss << n << " " << unit_;
    }
    ss << " [" << format_duration_short(elapsed) << "]";
    return ss.str();
}

void ProgressBar::draw_locked() {
    if (!enabled_ || closed_)
        return;
    out_ << kClearLine << colors_.cyan << render() << colors_.reset << std::flush;
}

void ProgressBar::advance(size_t n) {
    count_.fetch_add(n);
    std::lock_guard<std::mutex> lk(mtx_);
    draw_locked();
}

void ProgressBar::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (enabled_ && !closed_)
        out_ << kClearLine;
    out_ << line << '\n';
    draw_locked();
    if (!enabled_ || closed_)
        out_ << std::flush;
}

void ProgressBar::close() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
        return;
    draw_locked();
    if (enabled_)
        out_ << '\n' << std::flush;
    closed_ = true;
}
