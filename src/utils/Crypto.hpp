#pragma once

/**
 * Crypto.hpp
 *
 * Random identifiers, secrets and SHA-256 hashing using OpenSSL.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

namespace stevedore::utils {

/**
 * Crypto - randomness and encoding helpers
 */
class Crypto {
public:
    /**
     * Generate random bytes from the OpenSSL CSPRNG
     * @param length Number of bytes
     * @return Random bytes
     * @throws std::runtime_error if the generator fails
     */
    static std::vector<uint8_t> randomBytes(size_t length);

    /**
     * Hex-encoded random secret, as handed out for stream connections
     * @param length Number of random bytes (the string is twice as long)
     */
    static std::string randomSecret(size_t length = 32);

    /**
     * Random version 4 UUID in canonical text form
     */
    static std::string generateUUID();

    /**
     * Encode data to hex string
     */
    static std::string hexEncode(std::string_view data);

    /**
     * Encode data to Base64
     */
    static std::string base64Encode(std::string_view data);

    /**
     * SHA-256 of a buffer as lowercase hex
     */
    static std::string sha256Hex(std::string_view data);

    /**
     * SHA-256 of a file as lowercase hex
     * @return Hash, empty if the file cannot be read
     */
    static std::string sha256File(const std::string& filePath);
};

/**
 * Sha256 - incremental SHA-256 for data seen in chunks
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(std::string_view data);

    /**
     * Finish hashing
     * @return Digest as lowercase hex
     */
    std::string finalHex();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> m_ctx;
};

} // namespace stevedore::utils
