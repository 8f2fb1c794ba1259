#pragma once

#include <chrono>
#include <map>
#include <string>

using HttpHeaders = std::map<std::string, std::string>;
using HttpParameters = std::map<std::string, std::string>;

struct HttpResponse {
    bool transportOk = false;
    long statusCode = 0;
    std::string body;
    std::string error;
};

struct TlsSettings {
    bool enabled = false;
    std::string certPath;
    std::string keyPath;
    std::string caPath;
    bool verifyPeer = true;
    bool verifyHost = false;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse Post(
        const std::string& url,
        const HttpHeaders& headers,
        const std::string& body,
        std::chrono::seconds timeout) = 0;
    virtual HttpResponse Get(
        const std::string& url,
        const HttpHeaders& headers,
        const HttpParameters& parameters,
        std::chrono::seconds timeout) = 0;
};

class CprTransport : public HttpTransport {
public:
    explicit CprTransport(TlsSettings tlsSettings = {});

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

private:
    TlsSettings tlsSettings_;
};
