#include "JournalSource.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
constexpr std::array<const char*, 2> kTimestampFields = {
    "__REALTIME_TIMESTAMP",
    "_SOURCE_REALTIME_TIMESTAMP"
};

constexpr std::array<const char*, 7> kIntegerFields = {
    "PRIORITY",
    "SYSLOG_FACILITY",
    "SYSLOG_PID",
    "ERRNO",
    "_PID",
    "_UID",
    "_GID"
};

template <size_t N>
bool Contains(const std::array<const char*, N>& names, const std::string& name) {
    return std::any_of(names.begin(), names.end(), [&name](const char* candidate) {
        return name == candidate;
    });
}

bool ParseInteger(const std::string& text, std::int64_t& out) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = static_cast<std::int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

RawValue ConvertField(const std::string& name, const nlohmann::ordered_json& value) {
    if (value.is_null()) {
        return std::string();
    }
    if (!value.is_string()) {
        return value.dump();
    }

    const std::string text = value.get<std::string>();
    std::int64_t number = 0;
    if (Contains(kTimestampFields, name) && ParseInteger(text, number)) {
        return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(number)));
    }
    if (Contains(kIntegerFields, name) && ParseInteger(text, number)) {
        return number;
    }
    return text;
}
} // namespace

JournalSource::JournalSource(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

JournalSource::~JournalSource() {
    Close();
}

std::vector<std::string> JournalSource::BuildCommand(const std::string& priority) {
    return {
        "journalctl",
        "--follow",
        "--lines=0",
        "--output=json",
        "--priority=" + (priority.empty() ? std::string("err") : priority)
    };
}

std::optional<RawEvent> JournalSource::ParseLine(const std::string& line) {
    auto json = nlohmann::ordered_json::parse(line, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    RawEvent raw;
    raw.reserve(json.size());
    for (const auto& [name, value] : json.items()) {
        raw.push_back(RawField{name, ConvertField(name, value)});
    }
    return raw;
}

const std::string& JournalSource::Name() const {
    return name_;
}

bool JournalSource::Open() {
    if (IsOpen()) {
        return true;
    }
    if (argv_.empty()) {
        std::cerr << "[Journal] No reader command configured" << std::endl;
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv_.size() + 1);
    for (auto& arg : argv_) {
        cargv.push_back(&arg[0]);
    }
    cargv.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (pipe(fds) != 0) {
        std::cerr << "[Journal] pipe failed: " << std::strerror(errno) << std::endl;
        return false;
    }

    const pid_t pid = fork();
    if (pid == -1) {
        std::cerr << "[Journal] fork failed: " << std::strerror(errno) << std::endl;
        close(fds[0]);
        close(fds[1]);
        return false;
    }

    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        const int devNull = open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }
        close(fds[0]);
        close(fds[1]);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    close(fds[1]);
    fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL) | O_NONBLOCK);
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    child_ = pid;
    fd_ = fds[0];
    buffer_.clear();

    std::cout << "[Journal] Following " << argv_.front() << " (pid " << pid << ")" << std::endl;
    return true;
}

bool JournalSource::IsOpen() const {
    return fd_ >= 0;
}

int JournalSource::WaitFd() const {
    return fd_;
}

std::optional<RawEvent> JournalSource::PollNext() {
    if (pending_.empty() && IsOpen()) {
        ReadAvailable();
    }

    if (pending_.empty()) {
        return std::nullopt;
    }

    RawEvent next = std::move(pending_.front());
    pending_.pop_front();
    return next;
}

void JournalSource::Close() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }

    if (child_ > 0) {
        kill(child_, SIGTERM);
        int status = 0;
        while (waitpid(child_, &status, 0) == -1 && errno == EINTR) {
        }
        child_ = -1;
    }
}

void JournalSource::ReadAvailable() {
    char chunk[8192];
    bool reachedEof = false;
    for (;;) {
        const ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            reachedEof = true;
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::cerr << "[Journal] read failed: " << std::strerror(errno) << std::endl;
            reachedEof = true;
        }
        break;
    }

    size_t start = 0;
    for (size_t newline = buffer_.find('\n'); newline != std::string::npos; newline = buffer_.find('\n', start)) {
        const std::string line = buffer_.substr(start, newline - start);
        start = newline + 1;
        if (line.empty()) {
            continue;
        }

        auto raw = ParseLine(line);
        if (!raw) {
            std::cerr << "[Journal] Skipping unreadable journal record (" << line.size() << " bytes)" << std::endl;
            continue;
        }
        pending_.push_back(std::move(*raw));
    }
    buffer_.erase(0, start);

    if (reachedEof) {
        std::cerr << "[Journal] Reader exited; the subscription will be reopened" << std::endl;
        Close();
    }
}
