#include "ShellRunner.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
constexpr int kPollIntervalMs = 100;

std::string ErrnoMessage(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void ClosePipe(int fds[2]) {
    if (fds[0] >= 0) {
        close(fds[0]);
    }
    if (fds[1] >= 0) {
        close(fds[1]);
    }
}

// Returns false once the descriptor reached EOF or failed.
bool DrainInto(int fd, std::string& buffer) {
    char chunk[4096];
    for (;;) {
        const ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}
} // namespace

ShellOutput RunShellCommand(const std::string& command, std::chrono::seconds timeout) {
    ShellOutput output;

    int outfd[2] = {-1, -1};
    int errfd[2] = {-1, -1};
    if (pipe(outfd) != 0) {
        output.stderrText = ErrnoMessage("pipe");
        return output;
    }
    if (pipe(errfd) != 0) {
        output.stderrText = ErrnoMessage("pipe");
        ClosePipe(outfd);
        return output;
    }

    const pid_t pid = fork();
    if (pid == -1) {
        output.stderrText = ErrnoMessage("fork");
        ClosePipe(outfd);
        ClosePipe(errfd);
        return output;
    }

    if (pid == 0) {
        setpgid(0, 0);
        dup2(outfd[1], STDOUT_FILENO);
        dup2(errfd[1], STDERR_FILENO);
        ClosePipe(outfd);
        ClosePipe(errfd);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    output.started = true;
    setpgid(pid, pid);
    close(outfd[1]);
    close(errfd[1]);
    fcntl(outfd[0], F_SETFL, fcntl(outfd[0], F_GETFL) | O_NONBLOCK);
    fcntl(errfd[0], F_SETFL, fcntl(errfd[0], F_GETFL) | O_NONBLOCK);

    const auto start = std::chrono::steady_clock::now();
    const auto expired = [&]() {
        return timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout;
    };
    bool outOpen = true;
    bool errOpen = true;
    while (outOpen || errOpen) {
        pollfd fds[2] = {
            {outOpen ? outfd[0] : -1, POLLIN, 0},
            {errOpen ? errfd[0] : -1, POLLIN, 0}
        };
        const int rc = poll(fds, 2, kPollIntervalMs);
        if (rc < 0 && errno != EINTR) {
            break;
        }

        if (outOpen && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            outOpen = DrainInto(outfd[0], output.stdoutText);
        }
        if (errOpen && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            errOpen = DrainInto(errfd[0], output.stderrText);
        }

        if (expired()) {
            output.timedOut = true;
            kill(-pid, SIGKILL);
            break;
        }
    }

    close(outfd[0]);
    close(errfd[0]);

    // The child may have closed both streams and still be running.
    int status = 0;
    pid_t waited = -1;
    if (timeout.count() > 0 && !output.timedOut) {
        for (;;) {
            waited = waitpid(pid, &status, WNOHANG);
            if (waited == -1 && errno == EINTR) {
                continue;
            }
            if (waited != 0) {
                break;
            }
            if (expired()) {
                output.timedOut = true;
                kill(-pid, SIGKILL);
                break;
            }
            usleep(kPollIntervalMs * 1000);
        }
    }
    if (waited == 0 || waited == -1) {
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited == -1 && errno == EINTR);
    }

    if (waited == pid) {
        output.exitCode = DecodeStatus(status);
    } else {
        output.stderrText += ErrnoMessage("waitpid");
    }
    return output;
}
