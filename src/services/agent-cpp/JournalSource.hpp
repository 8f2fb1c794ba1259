#pragma once

#include "EventSource.hpp"

#include <deque>
#include <string>
#include <vector>

#include <sys/types.h>

// Follows the systemd journal through `journalctl --output=json`, one record per line.
class JournalSource : public EventSource {
public:
    explicit JournalSource(std::vector<std::string> argv);
    ~JournalSource() override;

    JournalSource(const JournalSource&) = delete;
    JournalSource& operator=(const JournalSource&) = delete;

    // journalctl invocation for new entries at or above priority (e.g. "err").
    static std::vector<std::string> BuildCommand(const std::string& priority);

    // One journal JSON line to a raw record; std::nullopt when the line is malformed.
    static std::optional<RawEvent> ParseLine(const std::string& line);

    const std::string& Name() const override;
    bool Open() override;
    bool IsOpen() const override;
    int WaitFd() const override;
    std::optional<RawEvent> PollNext() override;
    void Close() override;

private:
    void ReadAvailable();

    std::string name_ = "journal";
    std::vector<std::string> argv_;
    pid_t child_ = -1;
    int fd_ = -1;
    std::string buffer_;
    std::deque<RawEvent> pending_;
};
