#include "SecurityProvider.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cctype>
#include <iostream>
#include <utility>
#include <vector>

namespace {
struct BioDeleter {
    void operator()(BIO* bio) const {
        BIO_free(bio);
    }
};

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

std::string LastOpenSslError() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }

    char buffer[256] = {};
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}
} // namespace

void SecurityProvider::KeyDeleter::operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
}

SecurityProvider::SecurityProvider(std::string accessToken, std::string clientId, const std::string& clientSecret)
    : accessToken_(std::move(accessToken)),
      clientId_(std::move(clientId)) {
    std::string pem;
    if (clientSecret.empty() || !Base64Decode(clientSecret, pem)) {
        throw KeyLoadError("client secret is not valid base64");
    }

    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw KeyLoadError("unable to allocate key buffer: " + LastOpenSslError());
    }

    key_.reset(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key_) {
        throw KeyLoadError("unable to parse private key: " + LastOpenSslError());
    }

    if (EVP_PKEY_base_id(key_.get()) != EVP_PKEY_RSA) {
        throw KeyLoadError("private key is not an RSA key");
    }
}

const std::string& SecurityProvider::AccessToken() const {
    return accessToken_;
}

const std::string& SecurityProvider::ClientId() const {
    return clientId_;
}

bool SecurityProvider::Sign(const std::string& payload, std::string& outSignature) const {
    outSignature.clear();

    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        std::cerr << "[Security] signing failed: " << LastOpenSslError() << std::endl;
        return false;
    }

    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1) {
        std::cerr << "[Security] signing failed: " << LastOpenSslError() << std::endl;
        return false;
    }

    const auto* data = reinterpret_cast<const unsigned char*>(payload.data());
    size_t signatureSize = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &signatureSize, data, payload.size()) != 1) {
        std::cerr << "[Security] signing failed: " << LastOpenSslError() << std::endl;
        return false;
    }

    std::vector<unsigned char> signature(signatureSize);
    if (EVP_DigestSign(ctx.get(), signature.data(), &signatureSize, data, payload.size()) != 1) {
        std::cerr << "[Security] signing failed: " << LastOpenSslError() << std::endl;
        return false;
    }

    outSignature = Base64Encode(signature.data(), signatureSize);
    return true;
}

std::string SecurityProvider::Base64Encode(const unsigned char* data, size_t size) {
    if (size == 0) {
        return {};
    }

    std::string encoded(4 * ((size + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&encoded[0]),
        data,
        static_cast<int>(size));
    encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return encoded;
}

bool SecurityProvider::Base64Decode(const std::string& text, std::string& outBytes) {
    std::string compact;
    compact.reserve(text.size());
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            compact.push_back(ch);
        }
    }

    if (compact.empty() || compact.size() % 4 != 0) {
        return false;
    }

    std::string decoded(3 * compact.size() / 4, '\0');
    const int written = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(&decoded[0]),
        reinterpret_cast<const unsigned char*>(compact.data()),
        static_cast<int>(compact.size()));
    if (written < 0) {
        return false;
    }

    size_t padding = 0;
    if (compact.back() == '=') {
        ++padding;
        if (compact[compact.size() - 2] == '=') {
            ++padding;
        }
    }

    decoded.resize(static_cast<size_t>(written) - padding);
    outBytes = std::move(decoded);
    return true;
}
