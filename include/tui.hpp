#ifndef TUI_HPP
#define TUI_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

/**
 * @brief Resolved color codes for console output.
 *
 * All members are empty when colors are disabled.
 */
struct TuiColors {
    std::string reset;
    std::string green;
    std::string yellow;
    std::string red;
    std::string cyan;
    std::string bold;
};

/**
 * @brief Create a color palette honoring user preferences.
 */
TuiColors make_tui_colors(bool no_colors);

/**
 * @brief Whether standard output is attached to a terminal.
 */
bool stdout_is_terminal();

/**
 * @brief Single-line console progress indicator.
 *
 * The bar owns the last line of the terminal. Any text that must appear while
 * the bar is active goes through write_line(), which clears the bar, prints
 * the text on its own line and redraws the bar below it, so lines from
 * concurrent workers never interleave with the bar. All members are safe to
 * call from multiple threads.
 *
 * With an unknown total the bar shows a running count instead of a
 * percentage. When disabled it renders nothing and write_line() prints plain
 * lines.
 */
class ProgressBar {
  public:
    ProgressBar(std::ostream& out, std::string description, std::optional<size_t> total,
                std::string unit, bool enabled, TuiColors colors = {});
    ~ProgressBar();

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    /** @brief Advance the counter by @p n and redraw. */
    void advance(size_t n = 1);

    /** @brief Print @p line above the bar. */
    void write_line(const std::string& line);

    /** @brief Draw the final state and move to a fresh line. Idempotent. */
    void close();

    size_t count() const { return count_.load(); }

    /** @brief Text of the bar line without terminal control sequences. */
    std::string render() const;

  private:
    void draw_locked();

    std::ostream& out_;
    std::string description_;
    std::optional<size_t> total_;
    std::string unit_;
    bool enabled_;
    TuiColors colors_;
    std::atomic<size_t> count_{0};
    std::chrono::steady_clock::time_point start_;
    mutable std::mutex mtx_;
    bool closed_ = false;
};

#endif // TUI_HPP
