#include <openssl/evp.h>

#include <stdexcept>

#include "cache_key.hpp"

std::string derive_key(std::string_view url) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (EVP_Digest(url.data(), url.size(), digest, &len, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_Digest(sha256) failed");

    static constexpr char hex[] = "0123456789abcdef";
    std::string key;
    key.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        key.push_back(hex[digest[i] >> 4]);
        key.push_back(hex[digest[i] & 0x0f]);
    }
    return key;
}
