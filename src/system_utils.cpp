#include "system_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>

namespace procutil {

namespace {

void flush_line(std::string& line, const LineSink& on_line) {
    if (on_line)
        on_line(line);
    line.clear();
}

// Read the child's merged output until EOF, splitting on '\n' and '\r' so
// git's in-place progress updates arrive as separate lines.
void pump_output(int fd, const LineSink& on_line) {
    char buf[4096];
    std::string line;
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        for (ssize_t i = 0; i < n; ++i) {
            char c = buf[i];
            if (c == '\n' || c == '\r')
                flush_line(line, on_line);
            else
                line += c;
        }
    }
    if (!line.empty())
        flush_line(line, on_line);
}

} // namespace

CommandResult run_command(const std::vector<std::string>& args, const std::filesystem::path& cwd,
                          const LineSink& on_line) {
    CommandResult result;
    if (args.empty()) {
        result.error = "empty command";
        return result;
    }

    int out_fds[2];
    int err_fds[2];
    if (pipe2(out_fds, O_CLOEXEC) != 0) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    UniqueFd out_read(out_fds[0]);
    UniqueFd out_write(out_fds[1]);
    // Carries the child's errno if chdir or exec fails; closed by a
    // successful exec.
    if (pipe2(err_fds, O_CLOEXEC) != 0) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    UniqueFd err_read(err_fds[0]);
    UniqueFd err_write(err_fds[1]);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    const std::string dir = cwd.string();

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        int code = 0;
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            code = errno;
        } else if (dup2(out_write.get(), STDOUT_FILENO) < 0 ||
                   dup2(out_write.get(), STDERR_FILENO) < 0) {
            code = errno;
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0)
                dup2(devnull, STDIN_FILENO);
            execvp(argv[0], argv.data());
            code = errno;
        }
        ssize_t ignored = write(err_write.get(), &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    out_write.reset();
    err_write.reset();
    pump_output(out_read.get(), on_line);

    int child_errno = 0;
    ssize_t got;
    do {
        got = read(err_read.get(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("waitpid: ") + std::strerror(errno);
            return result;
        }
    }

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        result.error = std::strerror(child_errno);
        return result;
    }
    result.started = true;
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    return result;
}

} // namespace procutil
