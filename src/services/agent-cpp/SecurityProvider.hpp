#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

typedef struct evp_pkey_st EVP_PKEY;

class KeyLoadError : public std::runtime_error {
public:
    explicit KeyLoadError(const std::string& message)
        : std::runtime_error(message) {}
};

// Holds the agent identity and the RSA key every outbound payload is signed with.
// Shared read-only by all monitors; Sign() does not mutate the provider.
class SecurityProvider {
public:
    // clientSecret is the base64 encoding of a PEM private key.
    // Throws KeyLoadError when the key cannot be decoded or is not an RSA key.
    SecurityProvider(std::string accessToken, std::string clientId, const std::string& clientSecret);

    const std::string& AccessToken() const;
    const std::string& ClientId() const;

    // RSA-SHA256 (PKCS#1 v1.5) over the exact payload bytes, base64 encoded.
    bool Sign(const std::string& payload, std::string& outSignature) const;

    static std::string Base64Encode(const unsigned char* data, size_t size);
    static bool Base64Decode(const std::string& text, std::string& outBytes);

private:
    struct KeyDeleter {
        void operator()(EVP_PKEY* key) const;
    };

    std::string accessToken_;
    std::string clientId_;
    std::unique_ptr<EVP_PKEY, KeyDeleter> key_;
};
