#pragma once

#include "ShellRunner.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// One vitals category (or one partition) could not be read.
class CollectionSubProbeError : public std::runtime_error {
public:
    explicit CollectionSubProbeError(const std::string& message)
        : std::runtime_error(message) {}
};

struct PartitionInfo {
    std::string device;
    std::string mountpoint;
    std::string fstype;
};

struct PartitionUsage {
    std::uint64_t total = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
    double percent = 0.0;
};

struct CpuTimes {
    unsigned long long idle = 0;
    unsigned long long total = 0;
};

// Host inventory backend. Every member may throw CollectionSubProbeError.
class SystemProbe {
public:
    virtual ~SystemProbe() = default;

    virtual nlohmann::json SystemInfo() = 0;
    virtual nlohmann::json BootTime() = 0;
    virtual nlohmann::json CpuInfo() = 0;
    virtual nlohmann::json MemoryInfo() = 0;
    virtual nlohmann::json SwapInfo() = 0;
    virtual std::vector<PartitionInfo> Partitions() = 0;
    virtual PartitionUsage Usage(const PartitionInfo& partition) = 0;
    virtual nlohmann::json DiskIo() = 0;
    virtual nlohmann::json NetworkInfo() = 0;
    // std::nullopt when the package manager is not installed.
    virtual std::optional<nlohmann::json> Packages(const std::string& manager) = 0;
};

class LinuxSystemProbe : public SystemProbe {
public:
    explicit LinuxSystemProbe(ShellRunner runner = ShellRunner());

    nlohmann::json SystemInfo() override;
    nlohmann::json BootTime() override;
    nlohmann::json CpuInfo() override;
    nlohmann::json MemoryInfo() override;
    nlohmann::json SwapInfo() override;
    std::vector<PartitionInfo> Partitions() override;
    PartitionUsage Usage(const PartitionInfo& partition) override;
    nlohmann::json DiskIo() override;
    nlohmann::json NetworkInfo() override;
    std::optional<nlohmann::json> Packages(const std::string& manager) override;

    // Usage percentages from the delta between two /proc/stat samples.
    static double BusyPercent(const CpuTimes& previous, const CpuTimes& current);
    static std::vector<std::vector<std::string>> ParseDpkgList(const std::string& output);
    static std::vector<std::vector<std::string>> ParsePipList(const std::string& output);

private:
    ShellOutput Run(const std::string& command) const;
    bool HasCommand(const std::string& command) const;

    ShellRunner runner_;
    std::vector<CpuTimes> previousCpu_;
};

// Human readable size with a 1024 factor: 1536 -> "1.50KB".
std::string FormatSize(double bytes, const std::string& suffix = "B");
