#include "CommandExecutor.hpp"
#include "Configuration.hpp"
#include "DedupFilter.hpp"
#include "DeliveryClient.hpp"
#include "EventNormalizer.hpp"
#include "HttpTransport.hpp"
#include "JournalSource.hpp"
#include "MonitorLoop.hpp"
#include "MonitorScheduler.hpp"
#include "SecurityProvider.hpp"
#include "SystemProbe.hpp"
#include "Tracing.hpp"
#include "VitalsCollector.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
constexpr const char* kDefaultConfigPath = "/etc/iq-agent/config.json";

std::atomic<bool> g_stopRequested{false};

void HandleStopSignal(int) {
    g_stopRequested = true;
}

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

std::string ResolveConfigPath(int argc, char** argv) {
    if (argc > 1) {
        return argv[1];
    }
    return GetEnvOrDefault("IQ_AGENT_CONFIG", kDefaultConfigPath);
}

bool RequireKeys(const Configuration& config, const std::vector<std::string>& keys) {
    bool ok = true;
    for (const auto& key : keys) {
        if (!config.GetString(key) || config.GetString(key)->empty()) {
            std::cerr << "[Agent] Missing required setting " << key << std::endl;
            ok = false;
        }
    }
    return ok;
}

bool WaitForTlsFiles(const TlsSettings& settings, int timeoutSeconds) {
    if (settings.certPath.empty() || settings.keyPath.empty() || settings.caPath.empty()) {
        return false;
    }

    for (int attempt = 0; attempt < timeoutSeconds; ++attempt) {
        if (std::filesystem::exists(settings.certPath)
            && std::filesystem::exists(settings.keyPath)
            && std::filesystem::exists(settings.caPath)) {
            return true;
        }

        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    return false;
}

std::chrono::seconds Seconds(const Configuration& config, const std::string& key, long long fallback) {
    return std::chrono::seconds(config.IntOr(key, fallback));
}

std::chrono::milliseconds Interval(const Configuration& config, const std::string& key, long long fallback) {
    return std::chrono::seconds(config.IntAtLeast(key, fallback, 1));
}
} // namespace

int main(int argc, char** argv) {
    std::cout << "IQ Agent Starting..." << std::endl;

    const std::string configPath = ResolveConfigPath(argc, argv);
    Configuration config;
    std::string configError;
    if (!config.LoadFile(configPath, configError)) {
        std::cerr << "[Agent] Unable to load configuration " << configPath << ": " << configError << std::endl;
        return 1;
    }

    try {
        const bool executorEnabled = config.BoolOr("executor.enabled", true);
        std::vector<std::string> required = {
            "agent.access_token", "agent.client_id", "agent.client_secret", "service.ingest_url"};
        if (executorEnabled) {
            required.push_back("service.command_url");
        }
        if (!RequireKeys(config, required)) {
            return 1;
        }

        const std::string ingestUrl = *config.GetString("service.ingest_url");

        TlsSettings tlsSettings;
        tlsSettings.enabled = config.BoolOr("tls.enabled", false);
        if (tlsSettings.enabled) {
            tlsSettings.certPath = config.StringOr("tls.cert_path", "");
            tlsSettings.keyPath = config.StringOr("tls.key_path", "");
            tlsSettings.caPath = config.StringOr("tls.ca_path", "");
            tlsSettings.verifyPeer = config.BoolOr("tls.verify_peer", true);
            tlsSettings.verifyHost = config.BoolOr("tls.verify_host", false);

            if (ingestUrl.rfind("https://", 0) != 0) {
                std::cerr << "[Agent] tls.enabled requires an https ingest URL." << std::endl;
                return 1;
            }

            if (!WaitForTlsFiles(tlsSettings, 30)) {
                std::cerr << "[Agent] TLS enabled but certificate files are missing." << std::endl;
                return 1;
            }
        }

        TraceConfig traceConfig;
        traceConfig.enabled = config.BoolOr("tracing.enabled", false);
        traceConfig.endpoint = config.StringOr("tracing.endpoint", "");
        traceConfig.serviceName = config.StringOr("tracing.service_name", "iq-agent");
        traceConfig.clientId = *config.GetString("agent.client_id");
        Tracer::Instance().Configure(traceConfig);

        std::unique_ptr<SecurityProvider> security;
        try {
            security = std::make_unique<SecurityProvider>(
                *config.GetString("agent.access_token"),
                *config.GetString("agent.client_id"),
                *config.GetString("agent.client_secret"));
        } catch (const KeyLoadError& ex) {
            std::cerr << "[Agent] Unable to load the signing key: " << ex.what() << std::endl;
            return 1;
        }

        RetryPolicy policy;
        policy.maxAttempts = static_cast<int>(config.IntOr("delivery.max_attempts", 3));
        if (policy.maxAttempts < 1) {
            std::cerr << "[Agent] delivery.max_attempts must be at least 1" << std::endl;
            return 1;
        }

        CprTransport transport(tlsSettings);
        DeliveryClient client(transport, *security, policy, Seconds(config, "delivery.timeout", 300));

        MonitorScheduler scheduler;
        std::vector<std::unique_ptr<MonitorLoop>> monitors;

        if (config.BoolOr("journal.enabled", true)) {
            const auto priority = config.StringOr("journal.priority", "err");
            auto dedup = std::make_unique<DedupFilter>(
                static_cast<size_t>(config.IntAtLeast("journal.dedup_max_entries", 10000, 0)),
                Seconds(config, "journal.dedup_ttl", 0));
            monitors.push_back(std::make_unique<SubscribedMonitor>(
                "Journal",
                std::make_unique<JournalSource>(JournalSource::BuildCommand(priority)),
                [](const RawEvent& raw) { return NormalizeRecord(kJournalSource, raw); },
                client,
                ingestUrl,
                std::move(dedup)));
        }

        LinuxSystemProbe probe;
        VitalsCollector collector(probe);
        VitalsReporter reporter(collector, client, ingestUrl, Seconds(config, "vitals.timeout", 300));
        if (config.BoolOr("vitals.enabled", true)) {
            monitors.push_back(std::make_unique<TimerMonitor>(
                "Vitals",
                Interval(config, "vitals.interval", 300),
                [&reporter]() { reporter.Report(); }));
        }

        std::unique_ptr<CommandExecutor> executor;
        if (executorEnabled) {
            ExecutorSettings settings;
            settings.commandUrl = *config.GetString("service.command_url");
            settings.pollTimeout = Seconds(config, "executor.poll_timeout", 300);
            settings.replyTimeout = Seconds(config, "executor.reply_timeout", 300);
            settings.commandTimeout = Seconds(config, "executor.command_timeout", 0);
            executor = std::make_unique<CommandExecutor>(client, settings);

            CommandExecutor* runner = executor.get();
            monitors.push_back(std::make_unique<TimerMonitor>(
                "Executor",
                Interval(config, "executor.poll_interval", 5),
                [runner]() { runner->Run(); }));
        }

        if (monitors.empty()) {
            std::cerr << "[Agent] Every monitor is disabled; nothing to do." << std::endl;
            return 1;
        }

        for (auto& monitor : monitors) {
            scheduler.Add(*monitor);
        }

        std::signal(SIGINT, HandleStopSignal);
        std::signal(SIGTERM, HandleStopSignal);

        std::cout << "[Agent] Client " << security->ClientId() << " reporting to " << ingestUrl
                  << " with " << monitors.size() << " monitor(s)" << std::endl;
        scheduler.Run(g_stopRequested);
    } catch (const ConfigError& ex) {
        std::cerr << "[Agent] Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }

    Tracer::Instance().Shutdown();
    std::cout << "[Agent] Stopped." << std::endl;
    return 0;
}
