#pragma once

#include "DeliveryClient.hpp"
#include "Models.hpp"
#include "ShellRunner.hpp"

#include <chrono>
#include <string>
#include <vector>

struct ExecutorSettings {
    std::string commandUrl;
    std::chrono::seconds pollTimeout = std::chrono::seconds(300);
    std::chrono::seconds replyTimeout = std::chrono::seconds(300);
    std::chrono::seconds commandTimeout = std::chrono::seconds(0);
};

// Pulls pending commands from the service, runs each through the shell and
// posts one signed result per command to {commandUrl}{id}/result/.
class CommandExecutor {
public:
    CommandExecutor(DeliveryClient& client, ExecutorSettings settings, ShellRunner runner = ShellRunner());

    std::vector<ServerCommand> Poll();
    ServerCommandResult Execute(const ServerCommand& command) const;

    // Returns the number of results the service acknowledged.
    int Run();

private:
    DeliveryClient& client_;
    ExecutorSettings settings_;
    ShellRunner runner_;
};
