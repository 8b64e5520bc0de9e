// utils_tests.cpp
// Formatting and crypto helpers

#include <boost/ut.hpp>

#include "utils/Crypto.hpp"
#include "utils/StringUtils.hpp"

#include <chrono>
#include <string>

int main() {
  using namespace boost::ut;
  using stevedore::utils::Crypto;
  using stevedore::utils::Sha256;
  using stevedore::utils::StringUtils;

  "to_lower"_test = [] {
    expect(eq(StringUtils::toLower("ABCdef01"), std::string("abcdef01")));
    expect(eq(StringUtils::toLower(""), std::string()));
  };

  "format_bytes"_test = [] {
    expect(eq(StringUtils::formatBytes(512), std::string("512 B")));
    expect(eq(StringUtils::formatBytes(1536), std::string("1.5 KB")));
    expect(eq(StringUtils::formatBytes(5 * 1024 * 1024), std::string("5.0 MB")));
  };

  "format_rfc3339"_test = [] {
    auto time = std::chrono::system_clock::time_point(std::chrono::milliseconds(1714558830123));
    expect(eq(StringUtils::formatRfc3339(time), std::string("2024-05-01T10:20:30.123Z")));
  };

  "sha256"_test = [] {
    const std::string abcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    expect(eq(Crypto::sha256Hex("abc"), abcDigest));

    Sha256 hasher;
    hasher.update("a");
    hasher.update("bc");
    expect(eq(hasher.finalHex(), abcDigest));
  };

  "uuid_v4_layout"_test = [] {
    std::string uuid = Crypto::generateUUID();
    expect(uuid.size() == 36_ul);
    expect(uuid[8] == '-' && uuid[13] == '-' && uuid[18] == '-' && uuid[23] == '-');
    expect(uuid[14] == '4');
    expect(uuid != Crypto::generateUUID());
  };

  "secrets_are_hex"_test = [] {
    std::string secret = Crypto::randomSecret();
    expect(secret.size() == 64_ul);
    expect(secret.find_first_not_of("0123456789abcdef") == std::string::npos);
  };

  "base64"_test = [] {
    expect(eq(Crypto::base64Encode("hello"), std::string("aGVsbG8=")));
  };
}
