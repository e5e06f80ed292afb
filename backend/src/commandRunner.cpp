#include "commandRunner.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

/**
 * Create a pipe whose ends are not inherited by processes spawned
 * concurrently from other probe threads
 */
bool createPipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

int exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

CommandResult ProcessCommandRunner::run(const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout) {
    CommandResult result;
    if (args.empty()) {
        return result;
    }

    // Build argv before fork: only async-signal-safe calls are allowed in the child
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (!createPipe(fds)) {
        std::cerr << "Failed to create pipe for " << args[0] << ": " << strerror(errno) << std::endl;
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "Failed to fork for " << args[0] << ": " << strerror(errno) << std::endl;
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        dup2(fds[1], STDOUT_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(fds[1]);
    result.started = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= 0ms) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = fds[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll failed while reading " << args[0] << ": " << strerror(errno) << std::endl;
            break;
        }
        if (ready == 0) continue;

        ssize_t received = read(fds[0], buffer, sizeof(buffer));
        if (received > 0) {
            result.output.append(buffer, static_cast<size_t>(received));
        } else if (received == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            break;
        }
    }
    close(fds[0]);

    // stdout is closed; give the process until the deadline to exit
    int status = 0;
    while (!result.timed_out) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            result.exit_code = exitCodeFromStatus(status);
            return result;
        }
        if (done < 0 && errno != EINTR) {
            std::cerr << "waitpid failed for " << args[0] << ": " << strerror(errno) << std::endl;
            result.started = false;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(10ms);
    }

    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exit_code = exitCodeFromStatus(status);
    return result;
}
