#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/** Callback receiving one line of child output without the trailing newline. */
using LineSink = std::function<void(const std::string&)>;

/**
 * @brief Result of running an external command.
 *
 * `started` is false when the process could not be created or the
 * executable could not be run; `error` then describes why.
 */
struct CommandResult {
    bool started = false;
    int exit_code = -1;
    std::string error;

    bool ok() const { return started && exit_code == 0; }
};

/**
 * @brief Run @p args as a child process and wait for it.
 *
 * The child's stdout and stderr are merged into one pipe and forwarded line
 * by line to @p on_line. The executable is looked up in `PATH`.
 *
 * @param args    Program followed by its arguments. Must not be empty.
 * @param cwd     Working directory for the child, or empty to inherit.
 * @param on_line Receives each output line; may be empty to discard output.
 * @return Exit status, or `started == false` when the program could not run.
 *         A child killed by a signal reports `128 + signal`.
 */
CommandResult run_command(const std::vector<std::string>& args, const std::filesystem::path& cwd,
                          const LineSink& on_line);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
