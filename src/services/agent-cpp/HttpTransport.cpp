#include "HttpTransport.hpp"

#include <cpr/cpr.h>
#include <cpr/ssl_options.h>

#include <utility>

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(3);

cpr::SslOptions BuildSslOptions(const TlsSettings& settings) {
    return cpr::Ssl(
        cpr::ssl::CaInfo{settings.caPath},
        cpr::ssl::CertFile{settings.certPath},
        cpr::ssl::KeyFile{settings.keyPath},
        cpr::ssl::VerifyPeer{settings.verifyPeer},
        cpr::ssl::VerifyHost{settings.verifyHost});
}

cpr::Header ToCprHeader(const HttpHeaders& headers) {
    cpr::Header result;
    for (const auto& [name, value] : headers) {
        result[name] = value;
    }
    return result;
}

HttpResponse FromCprResponse(const cpr::Response& response) {
    HttpResponse result;
    result.transportOk = response.error.code == cpr::ErrorCode::OK;
    result.statusCode = response.status_code;
    result.body = response.text;
    result.error = response.error.message;
    return result;
}
} // namespace

CprTransport::CprTransport(TlsSettings tlsSettings)
    : tlsSettings_(std::move(tlsSettings)) {}

HttpResponse CprTransport::Post(
    const std::string& url,
    const HttpHeaders& headers,
    const std::string& body,
    std::chrono::seconds timeout) {
    cpr::Response response = tlsSettings_.enabled
        ? cpr::Post(
            cpr::Url{url},
            cpr::Body{body},
            ToCprHeader(headers),
            cpr::ConnectTimeout{kConnectTimeout},
            cpr::Timeout{timeout},
            BuildSslOptions(tlsSettings_))
        : cpr::Post(
            cpr::Url{url},
            cpr::Body{body},
            ToCprHeader(headers),
            cpr::ConnectTimeout{kConnectTimeout},
            cpr::Timeout{timeout});
    return FromCprResponse(response);
}

HttpResponse CprTransport::Get(
    const std::string& url,
    const HttpHeaders& headers,
    const HttpParameters& parameters,
    std::chrono::seconds timeout) {
    cpr::Parameters query;
    for (const auto& [name, value] : parameters) {
        query.Add(cpr::Parameter{name, value});
    }

    cpr::Response response = tlsSettings_.enabled
        ? cpr::Get(
            cpr::Url{url},
            query,
            ToCprHeader(headers),
            cpr::ConnectTimeout{kConnectTimeout},
            cpr::Timeout{timeout},
            BuildSslOptions(tlsSettings_))
        : cpr::Get(
            cpr::Url{url},
            query,
            ToCprHeader(headers),
            cpr::ConnectTimeout{kConnectTimeout},
            cpr::Timeout{timeout});
    return FromCprResponse(response);
}
