#include "DeliveryClient.hpp"
#include "TestSupport.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const std::string kUrl = "https://iq.example/api/v1/logs/";
} // namespace

int main() {
    const std::string secret = GenerateClientSecret();
    SecurityProvider security("token-1", "client-1", secret);
    const std::string payload = R"({"vitals":"{}"})";

    {
        FakeTransport transport;
        DeliveryClient client(transport, security);
        const DeliveryResult result = client.Deliver(kUrl, payload, "test event");
        if (!result.delivered || result.attempts != 1 || transport.CountPosts() != 1) {
            return Fail("201 on the first attempt should deliver with one request.");
        }

        const RecordedRequest& request = transport.requests.front();
        if (request.url != kUrl || request.body != payload) {
            return Fail("Request did not carry the url and exact payload.");
        }
        if (request.headers.at("Authorization") != "Bearer token-1"
            || request.headers.at("Client-ID") != "client-1"
            || request.headers.at("Content-Type") != "application/json") {
            return Fail("Missing identity headers.");
        }
        if (!VerifySignature(secret, request.body, request.headers.at("Signature"))) {
            return Fail("Signature header does not match the posted bytes.");
        }
        if (request.headers.count("traceparent") == 0 || request.headers.at("traceparent").rfind("00-", 0) != 0) {
            return Fail("traceparent header missing.");
        }
        if (request.timeout != std::chrono::seconds(300)) {
            return Fail("Default delivery timeout should be 300 seconds.");
        }
    }

    {
        FakeTransport transport;
        transport.postResponses = {MakeResponse(500, R"({"detail":"boom"})"), MakeResponse(503), MakeResponse(201)};
        DeliveryClient client(transport, security);
        const DeliveryResult result = client.Deliver(kUrl, payload, "test event");
        if (!result.delivered || result.attempts != 3 || transport.CountPosts() != 3) {
            return Fail("Two failures then 201 should deliver on the third attempt.");
        }
        for (const auto& request : transport.requests) {
            if (request.body != payload) {
                return Fail("Retries must resend the identical payload.");
            }
        }
        if (transport.requests[0].headers.at("Signature") != transport.requests[2].headers.at("Signature")) {
            return Fail("Payload should be signed once per delivery.");
        }
    }

    {
        FakeTransport transport;
        transport.fallback = MakeResponse(500, "<html>gateway</html>");
        DeliveryClient client(transport, security);
        const DeliveryResult result = client.Deliver(kUrl, payload, "test event");
        if (result.delivered || result.attempts != 3 || transport.CountPosts() != 3) {
            return Fail("Persistent failure should stop after exactly three attempts.");
        }
        if (result.lastStatus != 500 || result.lastError != "<html>gateway</html>") {
            return Fail("Non-JSON error body should be reported raw: " + result.lastError);
        }
    }

    {
        FakeTransport transport;
        transport.fallback = MakeResponse(200, "{}");
        RetryPolicy policy;
        policy.maxAttempts = 2;
        DeliveryClient client(transport, security, policy, std::chrono::seconds(7));
        const DeliveryResult result = client.Deliver(kUrl, payload, "test event");
        if (result.delivered || transport.CountPosts() != 2) {
            return Fail("Only 201 counts as success and the ceiling comes from the policy.");
        }
        if (transport.requests.back().timeout != std::chrono::seconds(7)) {
            return Fail("Configured timeout was not passed to the transport.");
        }
    }

    {
        FakeTransport transport;
        HttpResponse refused;
        refused.error = "connection refused";
        transport.fallback = refused;
        DeliveryClient client(transport, security);
        const DeliveryResult result = client.Deliver(kUrl, payload, "test event");
        if (result.delivered || result.attempts != 3 || result.lastError != "connection refused") {
            return Fail("Transport errors should be retried and reported.");
        }
    }

    if (DeliveryClient::ExtractErrorDetail(MakeResponse(400, R"({"detail":"bad signature"})")) != "bad signature") {
        return Fail("String detail should be extracted.");
    }
    if (DeliveryClient::ExtractErrorDetail(MakeResponse(422, R"({"detail":[{"loc":"body"}]})")).find("\"loc\"") == std::string::npos) {
        return Fail("Structured detail should be rendered as JSON.");
    }
    if (DeliveryClient::ExtractErrorDetail(MakeResponse(500)) != "empty response body") {
        return Fail("Empty body should be described.");
    }
    if (DeliveryClient::ExtractErrorDetail(MakeResponse(500, std::string(2000, 'x'))).size() != 515) {
        return Fail("Long raw bodies should be truncated.");
    }

    if (DeliveryClient::BuildResultUrl("https://iq.example/api/v1/commands/", "42") != "https://iq.example/api/v1/commands/42/result/") {
        return Fail("Unexpected result URL.");
    }

    {
        FakeTransport transport;
        DeliveryClient client(transport, security);
        client.Fetch("https://iq.example/api/v1/commands/", {{"status", "pending"}}, std::chrono::seconds(30));
        const RecordedRequest& request = transport.requests.front();
        if (request.method != "GET" || request.parameters.at("status") != "pending") {
            return Fail("Fetch should issue a GET with the given parameters.");
        }
        if (request.headers.count("Signature") != 0 || request.headers.at("Client-ID") != "client-1") {
            return Fail("Fetch carries identity headers but no signature.");
        }
    }

    return 0;
}
