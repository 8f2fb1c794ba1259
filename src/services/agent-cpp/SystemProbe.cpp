#include "SystemProbe.hpp"

#include "Models.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <utility>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace {
constexpr auto kPackageQueryTimeout = std::chrono::seconds(60);

double RoundTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

std::ifstream OpenProcFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CollectionSubProbeError("unable to read " + path + ": " + std::strerror(errno));
    }
    return file;
}

std::vector<CpuTimes> ReadCpuTimes() {
    std::ifstream statFile = OpenProcFile("/proc/stat");

    std::vector<CpuTimes> samples;
    std::string line;
    while (std::getline(statFile, line)) {
        if (line.compare(0, 3, "cpu") != 0) {
            continue;
        }

        std::istringstream iss(line);
        std::string label;
        iss >> label;

        unsigned long long user = 0;
        unsigned long long nice = 0;
        unsigned long long system = 0;
        unsigned long long idleVal = 0;
        unsigned long long iowait = 0;
        unsigned long long irq = 0;
        unsigned long long softirq = 0;
        unsigned long long steal = 0;
        iss >> user >> nice >> system >> idleVal >> iowait >> irq >> softirq >> steal;

        CpuTimes times;
        times.idle = idleVal + iowait;
        times.total = user + nice + system + idleVal + iowait + irq + softirq + steal;
        samples.push_back(times);
    }

    if (samples.empty()) {
        throw CollectionSubProbeError("/proc/stat has no cpu lines");
    }
    return samples;
}

// Values in bytes, keyed without the trailing colon.
std::map<std::string, unsigned long long> ReadMemInfo() {
    std::ifstream memFile = OpenProcFile("/proc/meminfo");

    std::map<std::string, unsigned long long> values;
    std::string line;
    while (std::getline(memFile, line)) {
        std::istringstream iss(line);
        std::string key;
        unsigned long long value = 0;
        if (!(iss >> key >> value) || key.empty()) {
            continue;
        }
        if (key.back() == ':') {
            key.pop_back();
        }
        values[key] = value * 1024ULL;
    }

    if (values.find("MemTotal") == values.end()) {
        throw CollectionSubProbeError("/proc/meminfo has no MemTotal");
    }
    return values;
}

unsigned long long Lookup(const std::map<std::string, unsigned long long>& values, const std::string& key) {
    auto it = values.find(key);
    return it == values.end() ? 0ULL : it->second;
}

double ReadFrequencyMhz(const std::string& path) {
    std::ifstream file(path);
    double khz = 0.0;
    if (file >> khz) {
        return khz / 1000.0;
    }
    return 0.0;
}

std::string UnescapeMountField(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 3 < value.size()) {
            const std::string octal = value.substr(i + 1, 3);
            if (std::all_of(octal.begin(), octal.end(), [](char ch) { return ch >= '0' && ch <= '7'; })) {
                result.push_back(static_cast<char>(std::stoi(octal, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        result.push_back(value[i]);
    }
    return result;
}

std::string AddressToString(const sockaddr* address) {
    if (address == nullptr) {
        return {};
    }

    char buffer[INET6_ADDRSTRLEN] = {};
    if (address->sa_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(address);
        inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer));
        return buffer;
    }
    if (address->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(address);
        inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer));
        return buffer;
    }
    if (address->sa_family == AF_PACKET) {
        const auto* ll = reinterpret_cast<const sockaddr_ll*>(address);
        std::string mac;
        for (int i = 0; i < ll->sll_halen; ++i) {
            char octet[4];
            std::snprintf(octet, sizeof(octet), i == 0 ? "%02x" : ":%02x", ll->sll_addr[i]);
            mac += octet;
        }
        return mac;
    }
    return {};
}

nlohmann::json AddressOrNull(const sockaddr* address) {
    const std::string text = AddressToString(address);
    return text.empty() ? nlohmann::json(nullptr) : nlohmann::json(text);
}

std::string FamilyName(int family) {
    switch (family) {
    case AF_INET:
        return "AF_INET";
    case AF_INET6:
        return "AF_INET6";
    case AF_PACKET:
        return "AF_PACKET";
    default:
        return std::to_string(family);
    }
}

std::string ResolveHostAddress(const std::string& hostName) {
    addrinfo hints = {};
    hints.ai_family = AF_INET;
    addrinfo* results = nullptr;
    if (getaddrinfo(hostName.c_str(), nullptr, &hints, &results) != 0 || results == nullptr) {
        return {};
    }

    const std::string address = AddressToString(results->ai_addr);
    freeaddrinfo(results);
    return address;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> FirstColumns(const std::string& line, size_t count) {
    std::istringstream stream(line);
    std::vector<std::string> columns;
    std::string column;
    while (columns.size() < count && stream >> column) {
        columns.push_back(column);
    }
    return columns;
}
} // namespace

std::string FormatSize(double bytes, const std::string& suffix) {
    constexpr double factor = 1024.0;
    static const char* const units[] = {"", "K", "M", "G", "T", "P"};

    for (const char* unit : units) {
        if (bytes < factor) {
            char buffer[64];
            std::snprintf(buffer, sizeof(buffer), "%.2f%s%s", bytes, unit, suffix.c_str());
            return buffer;
        }
        bytes /= factor;
    }
    throw CollectionSubProbeError("size is too large");
}

LinuxSystemProbe::LinuxSystemProbe(ShellRunner runner)
    : runner_(std::move(runner)) {}

nlohmann::json LinuxSystemProbe::SystemInfo() {
    struct utsname info;
    if (uname(&info) != 0) {
        throw CollectionSubProbeError(std::string("uname failed: ") + std::strerror(errno));
    }

    return {
        {"system", info.sysname},
        {"node_name", info.nodename},
        {"release", info.release},
        {"version", info.version},
        {"machine", info.machine},
        {"processor", info.machine}
    };
}

nlohmann::json LinuxSystemProbe::BootTime() {
    std::ifstream statFile = OpenProcFile("/proc/stat");

    std::string line;
    while (std::getline(statFile, line)) {
        std::istringstream iss(line);
        std::string key;
        long long seconds = 0;
        if (iss >> key >> seconds && key == "btime") {
            const auto bootTime = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(seconds));
            return {{"boot_time", FormatIsoTimestamp(bootTime)}};
        }
    }

    throw CollectionSubProbeError("/proc/stat has no btime");
}

nlohmann::json LinuxSystemProbe::CpuInfo() {
    std::ifstream cpuinfo = OpenProcFile("/proc/cpuinfo");

    std::string brand;
    std::set<std::pair<std::string, std::string>> physicalCores;
    std::string physicalId;
    double mhzSum = 0.0;
    int mhzCount = 0;

    std::string line;
    while (std::getline(cpuinfo, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = Trim(line.substr(0, colon));
        const std::string value = Trim(line.substr(colon + 1));
        if (key == "model name" && brand.empty()) {
            brand = value;
        } else if (key == "physical id") {
            physicalId = value;
        } else if (key == "core id") {
            physicalCores.emplace(physicalId, value);
        } else if (key == "cpu MHz") {
            mhzSum += std::atof(value.c_str());
            ++mhzCount;
        }
    }

    const long logical = sysconf(_SC_NPROCESSORS_ONLN);
    const long totalCores = logical > 0 ? logical : 1;
    const long physical = physicalCores.empty() ? totalCores : static_cast<long>(physicalCores.size());

    double currentMhz = mhzCount > 0 ? mhzSum / mhzCount : 0.0;
    if (currentMhz == 0.0) {
        currentMhz = ReadFrequencyMhz("/sys/devices/system/cpu/cpu0/cpufreq/scaling_cur_freq");
    }

    const std::vector<CpuTimes> current = ReadCpuTimes();
    const std::vector<CpuTimes> previous = previousCpu_.size() == current.size()
        ? previousCpu_
        : std::vector<CpuTimes>(current.size());
    previousCpu_ = current;

    nlohmann::json perCore = nlohmann::json::array();
    for (size_t i = 1; i < current.size(); ++i) {
        perCore.push_back(BusyPercent(previous[i], current[i]));
    }

    return {
        {"cpu_brand", brand},
        {"physical_cores", physical},
        {"total_cores", totalCores},
        {"max_frequency", ReadFrequencyMhz("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq")},
        {"min_frequency", ReadFrequencyMhz("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_min_freq")},
        {"current_frequency", currentMhz},
        {"cpu_usage_per_core", perCore},
        {"total_cpu_usage", BusyPercent(previous[0], current[0])}
    };
}

nlohmann::json LinuxSystemProbe::MemoryInfo() {
    const auto values = ReadMemInfo();
    const unsigned long long total = Lookup(values, "MemTotal");
    const unsigned long long free = Lookup(values, "MemFree");
    const unsigned long long cached = Lookup(values, "Cached") + Lookup(values, "SReclaimable");
    const unsigned long long buffers = Lookup(values, "Buffers");
    unsigned long long available = Lookup(values, "MemAvailable");
    if (available == 0) {
        available = free + cached + buffers;
    }

    const unsigned long long reclaimable = free + cached + buffers;
    const unsigned long long used = total > reclaimable ? total - reclaimable : 0ULL;
    const double percent = total > 0
        ? RoundTenth(static_cast<double>(total > available ? total - available : 0ULL) * 100.0 / static_cast<double>(total))
        : 0.0;

    return {
        {"total", FormatSize(static_cast<double>(total))},
        {"available", FormatSize(static_cast<double>(available))},
        {"used", FormatSize(static_cast<double>(used))},
        {"percentage", percent}
    };
}

nlohmann::json LinuxSystemProbe::SwapInfo() {
    const auto values = ReadMemInfo();
    const unsigned long long total = Lookup(values, "SwapTotal");
    const unsigned long long free = Lookup(values, "SwapFree");
    const unsigned long long used = total > free ? total - free : 0ULL;
    const double percent = total > 0 ? RoundTenth(static_cast<double>(used) * 100.0 / static_cast<double>(total)) : 0.0;

    return {
        {"total", FormatSize(static_cast<double>(total))},
        {"free", FormatSize(static_cast<double>(free))},
        {"used", FormatSize(static_cast<double>(used))},
        {"percentage", percent}
    };
}

std::vector<PartitionInfo> LinuxSystemProbe::Partitions() {
    std::ifstream mounts = OpenProcFile("/proc/mounts");

    std::vector<PartitionInfo> partitions;
    std::string line;
    while (std::getline(mounts, line)) {
        std::istringstream iss(line);
        PartitionInfo partition;
        if (!(iss >> partition.device >> partition.mountpoint >> partition.fstype)) {
            continue;
        }
        if (partition.device.empty() || partition.device.front() != '/') {
            continue;
        }
        partition.device = UnescapeMountField(partition.device);
        partition.mountpoint = UnescapeMountField(partition.mountpoint);
        partitions.push_back(std::move(partition));
    }
    return partitions;
}

PartitionUsage LinuxSystemProbe::Usage(const PartitionInfo& partition) {
    struct statvfs stats;
    if (statvfs(partition.mountpoint.c_str(), &stats) != 0) {
        throw CollectionSubProbeError(partition.mountpoint + ": " + std::strerror(errno));
    }

    PartitionUsage usage;
    const std::uint64_t blockSize = stats.f_frsize;
    usage.total = static_cast<std::uint64_t>(stats.f_blocks) * blockSize;
    usage.free = static_cast<std::uint64_t>(stats.f_bavail) * blockSize;
    usage.used = static_cast<std::uint64_t>(stats.f_blocks - stats.f_bfree) * blockSize;
    const std::uint64_t usable = usage.used + usage.free;
    usage.percent = usable > 0 ? RoundTenth(static_cast<double>(usage.used) * 100.0 / static_cast<double>(usable)) : 0.0;
    return usage;
}

nlohmann::json LinuxSystemProbe::DiskIo() {
    std::ifstream diskstats = OpenProcFile("/proc/diskstats");

    constexpr unsigned long long kSectorSize = 512;
    unsigned long long readBytes = 0;
    unsigned long long writeBytes = 0;
    std::string line;
    while (std::getline(diskstats, line)) {
        std::istringstream iss(line);
        unsigned int major = 0;
        unsigned int minor = 0;
        std::string name;
        unsigned long long readsCompleted = 0;
        unsigned long long readsMerged = 0;
        unsigned long long sectorsRead = 0;
        unsigned long long timeReading = 0;
        unsigned long long writesCompleted = 0;
        unsigned long long writesMerged = 0;
        unsigned long long sectorsWritten = 0;
        if (!(iss >> major >> minor >> name >> readsCompleted >> readsMerged >> sectorsRead >> timeReading
                  >> writesCompleted >> writesMerged >> sectorsWritten)) {
            continue;
        }

        std::error_code error;
        if (!std::filesystem::exists("/sys/block/" + name, error)) {
            continue;
        }
        readBytes += sectorsRead * kSectorSize;
        writeBytes += sectorsWritten * kSectorSize;
    }

    return {
        {"total_read", FormatSize(static_cast<double>(readBytes))},
        {"total_write", FormatSize(static_cast<double>(writeBytes))}
    };
}

nlohmann::json LinuxSystemProbe::NetworkInfo() {
    ifaddrs* addresses = nullptr;
    if (getifaddrs(&addresses) != 0) {
        throw CollectionSubProbeError(std::string("getifaddrs failed: ") + std::strerror(errno));
    }

    nlohmann::json interfaces = nlohmann::json::object();
    for (ifaddrs* entry = addresses; entry != nullptr; entry = entry->ifa_next) {
        if (entry->ifa_addr == nullptr || entry->ifa_name == nullptr) {
            continue;
        }

        const int family = entry->ifa_addr->sa_family;
        if (family != AF_INET && family != AF_INET6 && family != AF_PACKET) {
            continue;
        }

        const bool hasBroadcast = (entry->ifa_flags & IFF_BROADCAST) != 0;
        nlohmann::json address = {
            {"address", AddressToString(entry->ifa_addr)},
            {"netmask", AddressOrNull(entry->ifa_netmask)},
            {"broadcast", hasBroadcast ? AddressOrNull(entry->ifa_broadaddr) : nlohmann::json(nullptr)},
            {"family", FamilyName(family)}
        };
        interfaces[entry->ifa_name].push_back(std::move(address));
    }
    freeifaddrs(addresses);

    unsigned long long bytesRecv = 0;
    unsigned long long bytesSent = 0;
    std::ifstream netdev("/proc/net/dev");
    std::string line;
    while (std::getline(netdev, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::istringstream iss(line.substr(colon + 1));
        std::vector<unsigned long long> fields;
        unsigned long long value = 0;
        while (iss >> value) {
            fields.push_back(value);
        }
        if (fields.size() >= 9) {
            bytesRecv += fields[0];
            bytesSent += fields[8];
        }
    }

    char hostBuffer[256] = {};
    std::string hostName;
    if (gethostname(hostBuffer, sizeof(hostBuffer) - 1) == 0) {
        hostName = hostBuffer;
    }

    return {
        {"host_name", hostName},
        {"ip_address", hostName.empty() ? std::string() : ResolveHostAddress(hostName)},
        {"interfaces", interfaces},
        {"io_counters", {
            {"bytes_sent", FormatSize(static_cast<double>(bytesSent))},
            {"bytes_recv", FormatSize(static_cast<double>(bytesRecv))}
        }}
    };
}

std::optional<nlohmann::json> LinuxSystemProbe::Packages(const std::string& manager) {
    std::string listCommand;
    if (manager == "dpkg") {
        listCommand = "dpkg -l";
    } else if (manager == "rpm") {
        listCommand = "rpm -qa";
    } else if (manager == "pip") {
        listCommand = "pip list";
    } else {
        throw CollectionSubProbeError("unsupported package manager " + manager);
    }

    if (!HasCommand(manager)) {
        return std::nullopt;
    }

    const ShellOutput output = Run(listCommand);
    if (!output.started || output.exitCode != 0) {
        const std::string reason = Trim(output.stderrText);
        return nlohmann::json{{manager + "_error", reason.empty() ? "exit code " + std::to_string(output.exitCode) : reason}};
    }

    if (manager == "dpkg") {
        return nlohmann::json(ParseDpkgList(output.stdoutText));
    }
    if (manager == "pip") {
        return nlohmann::json(ParsePipList(output.stdoutText));
    }

    nlohmann::json packages = nlohmann::json::array();
    for (const auto& line : SplitLines(Trim(output.stdoutText))) {
        if (!line.empty()) {
            packages.push_back(line);
        }
    }
    return packages;
}

double LinuxSystemProbe::BusyPercent(const CpuTimes& previous, const CpuTimes& current) {
    if (current.total <= previous.total) {
        return 0.0;
    }

    const unsigned long long totalDelta = current.total - previous.total;
    const unsigned long long idleDelta = current.idle > previous.idle ? current.idle - previous.idle : 0ULL;
    const unsigned long long busyDelta = totalDelta > idleDelta ? totalDelta - idleDelta : 0ULL;
    return RoundTenth(static_cast<double>(busyDelta) * 100.0 / static_cast<double>(totalDelta));
}

std::vector<std::vector<std::string>> LinuxSystemProbe::ParseDpkgList(const std::string& output) {
    std::vector<std::vector<std::string>> packages;
    for (const auto& line : SplitLines(output)) {
        if (line.compare(0, 2, "ii") != 0) {
            continue;
        }
        const auto columns = FirstColumns(line, 3);
        if (columns.size() == 3) {
            packages.push_back({columns[1], columns[2]});
        }
    }
    return packages;
}

std::vector<std::vector<std::string>> LinuxSystemProbe::ParsePipList(const std::string& output) {
    std::vector<std::vector<std::string>> packages;
    const auto lines = SplitLines(Trim(output));
    for (size_t i = 2; i < lines.size(); ++i) {
        auto columns = FirstColumns(lines[i], 2);
        if (!columns.empty()) {
            packages.push_back(std::move(columns));
        }
    }
    return packages;
}

ShellOutput LinuxSystemProbe::Run(const std::string& command) const {
    return runner_ ? runner_(command) : RunShellCommand(command, kPackageQueryTimeout);
}

bool LinuxSystemProbe::HasCommand(const std::string& command) const {
    const ShellOutput output = Run(command + " --version >/dev/null 2>&1");
    return output.started && output.exitCode == 0;
}
