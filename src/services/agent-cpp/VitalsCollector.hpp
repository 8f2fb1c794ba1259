#pragma once

#include "DeliveryClient.hpp"
#include "SystemProbe.hpp"

#include <nlohmann/json.hpp>

#include <string>

// Builds the vitals tree. A category that fails is logged and left out; the
// rest of the tree is still produced.
class VitalsCollector {
public:
    explicit VitalsCollector(SystemProbe& probe);

    nlohmann::json Collect();

private:
    nlohmann::json CollectDisks();
    void CollectPackages(nlohmann::json& tree);

    SystemProbe& probe_;
};

class VitalsReporter {
public:
    VitalsReporter(VitalsCollector& collector, DeliveryClient& client, std::string ingestUrl, std::chrono::seconds timeout);

    // Collects one snapshot and delivers it. Returns true when the server acknowledged it.
    bool Report();

private:
    VitalsCollector& collector_;
    DeliveryClient& client_;
    std::string ingestUrl_;
    std::chrono::seconds timeout_;
};
