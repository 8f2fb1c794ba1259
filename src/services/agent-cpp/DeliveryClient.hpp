#pragma once

#include "HttpTransport.hpp"
#include "SecurityProvider.hpp"

#include <chrono>
#include <string>

// Attempt ceiling and response classification for one signed POST.
struct RetryPolicy {
    int maxAttempts = 3;
    long successStatus = 201;

    bool IsSuccess(const HttpResponse& response) const;
};

struct DeliveryResult {
    bool delivered = false;
    int attempts = 0;
    long lastStatus = 0;
    std::string lastError;
};

class DeliveryClient {
public:
    DeliveryClient(
        HttpTransport& transport,
        const SecurityProvider& security,
        RetryPolicy policy = {},
        std::chrono::seconds timeout = std::chrono::seconds(300));

    // Signs payload once and POSTs the same bytes up to policy.maxAttempts times.
    // Never throws; an exhausted payload is logged and dropped.
    DeliveryResult Deliver(const std::string& url, const std::string& payload, const std::string& description);
    DeliveryResult Deliver(
        const std::string& url,
        const std::string& payload,
        const std::string& description,
        const RetryPolicy& policy,
        std::chrono::seconds timeout);

    // Authenticated GET without a body signature.
    HttpResponse Fetch(const std::string& url, const HttpParameters& parameters, std::chrono::seconds timeout);

    HttpHeaders BuildHeaders(const std::string& signature) const;
    const RetryPolicy& Policy() const;

    static std::string ExtractErrorDetail(const HttpResponse& response);
    static std::string BuildResultUrl(const std::string& commandUrl, const std::string& commandId);

private:
    HttpTransport& transport_;
    const SecurityProvider& security_;
    RetryPolicy policy_;
    std::chrono::seconds timeout_;
};
