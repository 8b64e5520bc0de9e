/**
 * Crypto.cpp
 *
 * OpenSSL-backed implementation of the crypto helpers.
 */

#include "Crypto.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>

#include <fstream>
#include <stdexcept>

namespace stevedore::utils {

std::vector<uint8_t> Crypto::randomBytes(size_t length) {
    std::vector<uint8_t> bytes(length);

    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }

    return bytes;
}

std::string Crypto::randomSecret(size_t length) {
    auto bytes = randomBytes(length);
    return hexEncode(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

std::string Crypto::generateUUID() {
    auto bytes = randomBytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80); // variant

    std::string hex = hexEncode(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string Crypto::hexEncode(std::string_view data) {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(data.size() * 2);

    for (unsigned char c : data) {
        result.push_back(hexChars[c >> 4]);
        result.push_back(hexChars[c & 0x0f]);
    }

    return result;
}

std::string Crypto::base64Encode(std::string_view data) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);

    BIO_free_all(bio);

    return result;
}

std::string Crypto::sha256Hex(std::string_view data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalHex();
}

std::string Crypto::sha256File(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) return "";

    Sha256 hasher;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        hasher.update(std::string_view(buffer, static_cast<size_t>(file.gcount())));
    }

    return hasher.finalHex();
}

// -- Sha256 --

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    if (ctx) EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : m_ctx(EVP_MD_CTX_new()) {
    if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(std::string_view data) {
    if (EVP_DigestUpdate(m_ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::finalHex() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    if (EVP_DigestFinal_ex(m_ctx.get(), hash, &hashLen) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }

    return Crypto::hexEncode(std::string_view(reinterpret_cast<const char*>(hash), hashLen));
}

} // namespace stevedore::utils
