#pragma once

#include "HttpTransport.hpp"

#include <chrono>
#include <deque>
#include <string>
#include <vector>

// Base64 of a freshly generated 2048-bit RSA key in PEM form, the shape
// agent.client_secret has in a real settings file.
std::string GenerateClientSecret();

// RSA-SHA256 verification with the public half of clientSecret.
bool VerifySignature(const std::string& clientSecret, const std::string& payload, const std::string& signature);

HttpResponse MakeResponse(long statusCode, const std::string& body = "");

struct RecordedRequest {
    std::string method;
    std::string url;
    HttpHeaders headers;
    HttpParameters parameters;
    std::string body;
    std::chrono::seconds timeout{0};
};

// Replays queued responses in order; once a queue is empty every call gets the
// fallback response.
class FakeTransport : public HttpTransport {
public:
    HttpResponse Post(
        const std::string& url,
        const HttpHeaders& headers,
        const std::string& body,
        std::chrono::seconds timeout) override;

    HttpResponse Get(
        const std::string& url,
        const HttpHeaders& headers,
        const HttpParameters& parameters,
        std::chrono::seconds timeout) override;

    std::deque<HttpResponse> postResponses;
    std::deque<HttpResponse> getResponses;
    HttpResponse fallback = MakeResponse(201);
    std::vector<RecordedRequest> requests;

    size_t CountPosts() const;
};
