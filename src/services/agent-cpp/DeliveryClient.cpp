#include "DeliveryClient.hpp"
#include "Tracing.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace {
constexpr size_t kMaxRawDetailLength = 512;
} // namespace

bool RetryPolicy::IsSuccess(const HttpResponse& response) const {
    return response.transportOk && response.statusCode == successStatus;
}

DeliveryClient::DeliveryClient(
    HttpTransport& transport,
    const SecurityProvider& security,
    RetryPolicy policy,
    std::chrono::seconds timeout)
    : transport_(transport),
      security_(security),
      policy_(std::move(policy)),
      timeout_(timeout) {}

DeliveryResult DeliveryClient::Deliver(const std::string& url, const std::string& payload, const std::string& description) {
    return Deliver(url, payload, description, policy_, timeout_);
}

DeliveryResult DeliveryClient::Deliver(
    const std::string& url,
    const std::string& payload,
    const std::string& description,
    const RetryPolicy& policy,
    std::chrono::seconds timeout) {
    DeliveryResult result;

    std::string signature;
    if (!security_.Sign(payload, signature)) {
        result.lastError = "payload signing failed";
        std::cerr << "[Delivery] Dropping " << description << ": " << result.lastError << std::endl;
        return result;
    }

    const HttpHeaders baseHeaders = BuildHeaders(signature);
    const int maxAttempts = policy.maxAttempts > 0 ? policy.maxAttempts : 1;

    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        ScopedSpan span("agent.deliver");
        span.SetAttribute("http.method", "POST");
        span.SetAttribute("http.url", url);
        span.SetAttribute("retry.attempt", static_cast<int64_t>(attempt + 1));

        HttpHeaders headers = baseHeaders;
        headers["traceparent"] = span.TraceParent();

        const HttpResponse response = transport_.Post(url, headers, payload, timeout);
        result.attempts = attempt + 1;
        result.lastStatus = response.statusCode;
        span.SetAttribute("http.status_code", static_cast<int64_t>(response.statusCode));

        if (policy.IsSuccess(response)) {
            span.MarkSucceeded();
            result.delivered = true;
            result.lastError.clear();
            return result;
        }

        result.lastError = ExtractErrorDetail(response);
        std::cerr << "[Delivery] Failed to send " << description
                  << " (Attempt " << result.attempts << "/" << maxAttempts << "). Code: "
                  << response.statusCode << " Reason: " << result.lastError << std::endl;
    }

    std::cerr << "[Delivery] Giving up on " << description << " after " << result.attempts
              << " attempt(s); event dropped." << std::endl;
    return result;
}

HttpResponse DeliveryClient::Fetch(const std::string& url, const HttpParameters& parameters, std::chrono::seconds timeout) {
    ScopedSpan span("agent.poll");
    span.SetAttribute("http.method", "GET");
    span.SetAttribute("http.url", url);

    HttpHeaders headers = {
        {"Authorization", "Bearer " + security_.AccessToken()},
        {"Client-ID", security_.ClientId()},
        {"traceparent", span.TraceParent()}
    };

    HttpResponse response = transport_.Get(url, headers, parameters, timeout);
    span.SetAttribute("http.status_code", static_cast<int64_t>(response.statusCode));
    if (response.transportOk && response.statusCode == 200) {
        span.MarkSucceeded();
    }
    return response;
}

HttpHeaders DeliveryClient::BuildHeaders(const std::string& signature) const {
    return {
        {"Authorization", "Bearer " + security_.AccessToken()},
        {"Client-ID", security_.ClientId()},
        {"Content-Type", "application/json"},
        {"Signature", signature}
    };
}

const RetryPolicy& DeliveryClient::Policy() const {
    return policy_;
}

std::string DeliveryClient::ExtractErrorDetail(const HttpResponse& response) {
    if (!response.transportOk) {
        return response.error.empty() ? "no response" : response.error;
    }

    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("detail")) {
        const auto& detail = json["detail"];
        return detail.is_string() ? detail.get<std::string>() : detail.dump(4);
    }

    if (response.body.empty()) {
        return "empty response body";
    }

    if (response.body.size() > kMaxRawDetailLength) {
        return response.body.substr(0, kMaxRawDetailLength) + "...";
    }
    return response.body;
}

std::string DeliveryClient::BuildResultUrl(const std::string& commandUrl, const std::string& commandId) {
    return commandUrl + commandId + "/result/";
}
