/**
 * @file process_utils.cpp
 * @brief POSIX implementation of host subprocess execution
 *
 * fork()/execvp() with three pipes: stdout, stderr and a close-on-exec status
 * pipe that reports exec failures back to the parent. Everything the child
 * needs (argv pointers, redirection descriptors) is prepared before fork() so
 * the child only calls async-signal-safe functions; the session runs
 * commands from supervisor threads.
 *
 * @date 2025
 */

#include "monolith/utils/process_utils.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <algorithm>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace monolith {
namespace utils {

namespace {

void AppendLimited(std::string& dst, const char* src, ssize_t n,
                   std::size_t limit, bool& truncated) {
    if (n <= 0) {
        return;
    }
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<std::size_t>(n)) {
        truncated = true;
    }
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // anonymous namespace

ProcessResult RunProcess(const ProcessSpec& spec) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.error_message = "empty argument vector";
        return result;
    }

    // Redirection targets are opened before fork()
    int stdin_fd = -1;
    int stdout_file_fd = -1;
    const std::string stdin_path = spec.stdin_file.empty() ? "/dev/null" : spec.stdin_file.string();
    stdin_fd = ::open(stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd < 0) {
        result.error_message = "cannot open " + stdin_path + ": " + std::strerror(errno);
        return result;
    }
    if (!spec.stdout_file.empty()) {
        stdout_file_fd = ::open(spec.stdout_file.c_str(),
                                O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (stdout_file_fd < 0) {
            result.error_message = "cannot open " + spec.stdout_file.string() + ": " + std::strerror(errno);
            CloseFd(stdin_fd);
            return result;
        }
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                        &status_pipe[0], &status_pipe[1], &stdin_fd, &stdout_file_fd}) {
            CloseFd(*fd);
        }
        return result;
    }

    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const std::string cwd = spec.working_dir.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error_message = std::string("fork failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                        &status_pipe[0], &status_pipe[1], &stdin_fd, &stdout_file_fd}) {
            CloseFd(*fd);
        }
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(stdin_fd, STDIN_FILENO);
        ::dup2(stdout_file_fd >= 0 ? stdout_file_fd : out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            int err = errno;
            (void)!::write(status_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        ::execvp(argv[0], argv.data());
        int err = errno;
        (void)!::write(status_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(status_pipe[1]);
    CloseFd(stdin_fd);
    CloseFd(stdout_file_fd);

    int exec_errno = 0;
    ssize_t status_read = 0;
    do {
        status_read = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_read < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    char buffer[4096];
    struct pollfd fds[2];
    fds[0] = {out_pipe[0], POLLIN, 0};
    fds[1] = {err_pipe[0], POLLIN, 0};
    int open_streams = 2;

    while (open_streams > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed while reading child output: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                if (i == 0) {
                    AppendLimited(result.stdout_output, buffer, n,
                                  spec.max_output_bytes, result.stdout_truncated);
                } else {
                    AppendLimited(result.stderr_output, buffer, n,
                                  spec.max_output_bytes, result.stderr_truncated);
                }
            } else if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }
    CloseFd(out_pipe[0]);
    CloseFd(err_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }

    if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.spawned = false;
        result.error_message = "cannot execute " + spec.argv.front() + ": " + std::strerror(exec_errno);
        return result;
    }

    result.spawned = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.stdout_truncated || result.stderr_truncated) {
        spdlog::warn("Output of '{}' truncated at {} bytes",
                     spec.argv.front(), spec.max_output_bytes);
    }

    return result;
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& arg : argv) {
        quoted.push_back(StringUtils::ShellQuote(arg));
    }
    return StringUtils::Join(quoted, " ");
}

} // namespace utils
} // namespace monolith
