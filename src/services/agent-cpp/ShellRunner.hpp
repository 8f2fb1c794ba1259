#pragma once

#include <chrono>
#include <functional>
#include <string>

struct ShellOutput {
    bool started = false;
    int exitCode = -1;
    bool timedOut = false;
    std::string stdoutText;
    std::string stderrText;
};

using ShellRunner = std::function<ShellOutput(const std::string&)>;

// Runs `/bin/sh -c command`, capturing both streams. A signal-terminated child
// reports 128 + signal. timeout == 0 waits for the child indefinitely.
// Fork/pipe failures come back with started == false and the reason in stderrText.
ShellOutput RunShellCommand(const std::string& command, std::chrono::seconds timeout = std::chrono::seconds(0));
