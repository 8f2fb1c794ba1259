#include "CommandExecutor.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

CommandExecutor::CommandExecutor(DeliveryClient& client, ExecutorSettings settings, ShellRunner runner)
    : client_(client),
      settings_(std::move(settings)),
      runner_(std::move(runner)) {}

std::vector<ServerCommand> CommandExecutor::Poll() {
    std::vector<ServerCommand> commands;

    const HttpResponse response = client_.Fetch(
        settings_.commandUrl,
        HttpParameters{{"status", "pending"}},
        settings_.pollTimeout);

    if (!response.transportOk) {
        std::cerr << "[Executor] Failed to poll the service: " << response.error << std::endl;
        return commands;
    }

    if (response.statusCode != 200) {
        std::cerr << "[Executor] Failed to poll the service. Code: " << response.statusCode
                  << " Reason: " << DeliveryClient::ExtractErrorDetail(response) << std::endl;
        return commands;
    }

    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        std::cerr << "[Executor] Poll response is not a JSON array; ignoring it." << std::endl;
        return commands;
    }

    for (const auto& item : json) {
        ServerCommand command;
        std::string error;
        if (!FromJson(item, command, error)) {
            std::cerr << "[Executor] Skipping invalid command: " << error << std::endl;
            continue;
        }
        commands.push_back(std::move(command));
    }

    return commands;
}

ServerCommandResult CommandExecutor::Execute(const ServerCommand& command) const {
    ServerCommandResult result;
    result.startDate = std::chrono::system_clock::now();

    ShellOutput output = runner_ ? runner_(command.command) : RunShellCommand(command.command, settings_.commandTimeout);

    result.endDate = std::chrono::system_clock::now();
    result.totalTime = std::chrono::duration<double>(result.endDate - result.startDate).count();
    result.exitCode = output.exitCode;

    if (output.started) {
        result.stdoutText = std::move(output.stdoutText);
        result.stderrText = std::move(output.stderrText);
        if (output.timedOut) {
            result.stderrText->append("\ncommand timed out and was killed");
        }
    } else {
        std::cerr << "[Executor] Command " << command.id << " could not be started: " << output.stderrText << std::endl;
        result.stderrText = std::move(output.stderrText);
    }

    return result;
}

int CommandExecutor::Run() {
    int acknowledged = 0;

    const std::vector<ServerCommand> commands = Poll();
    for (const auto& command : commands) {
        std::cout << "[Executor] Executing command " << command.id << std::endl;
        const ServerCommandResult result = Execute(command);

        const std::string payload = Serialize(ToJson(result));
        const DeliveryResult delivery = client_.Deliver(
            DeliveryClient::BuildResultUrl(settings_.commandUrl, command.id),
            payload,
            "result of command " + command.id,
            client_.Policy(),
            settings_.replyTimeout);

        if (delivery.delivered) {
            ++acknowledged;
        }
    }

    return acknowledged;
}
